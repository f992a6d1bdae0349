// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef EVOUCHER_SRC_VOUCHER_METADATA_H_
#define EVOUCHER_SRC_VOUCHER_METADATA_H_

#include <json/json.h>
#include <optional>
#include <string>

namespace evoucher {
    /// Serializes merchant metadata as compact JSON with object keys in
    /// sorted order, so equal metadata always yields the same text.
    /// \param metadata JSON object holding the metadata.
    /// \return the canonical text, or std::nullopt if the value is null or
    ///         an empty object.
    auto metadata_to_text(const Json::Value& metadata)
        -> std::optional<std::string>;

    /// Parses merchant metadata text.
    /// \param text JSON text.
    /// \return the parsed metadata, or std::nullopt if the text is not a
    ///         JSON object.
    auto parse_metadata(const std::string& text) -> std::optional<Json::Value>;
}

#endif // EVOUCHER_SRC_VOUCHER_METADATA_H_
