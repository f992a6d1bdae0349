// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "metadata.hpp"

namespace evoucher {
    auto metadata_to_text(const Json::Value& metadata)
        -> std::optional<std::string> {
        if(metadata.isNull() || (metadata.isObject() && metadata.empty())) {
            return std::nullopt;
        }

        auto builder = Json::StreamWriterBuilder();
        builder["indentation"] = "";
        builder["commentStyle"] = "None";
        return Json::writeString(builder, metadata);
    }

    auto parse_metadata(const std::string& text) -> std::optional<Json::Value> {
        auto ret = Json::Value();
        auto r = Json::Reader();
        if(!r.parse(text, ret, false)) {
            return std::nullopt;
        }
        if(!ret.isObject()) {
            return std::nullopt;
        }
        return ret;
    }
}
