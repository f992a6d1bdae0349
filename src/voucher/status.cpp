// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "status.hpp"

namespace evoucher {
    auto to_string(voucher_status status) -> std::string {
        switch(status) {
            case voucher_status::issued:
                return "ISSUED";
            case voucher_status::redeemed:
                return "REDEEMED";
            case voucher_status::revoked:
                return "REVOKED";
            case voucher_status::expired:
                return "EXPIRED";
            case voucher_status::unknown:
                break;
        }
        return "UNKNOWN";
    }

    auto parse_status(const std::string& name) -> voucher_status {
        if(name == "ISSUED") {
            return voucher_status::issued;
        }
        if(name == "REDEEMED") {
            return voucher_status::redeemed;
        }
        if(name == "REVOKED") {
            return voucher_status::revoked;
        }
        if(name == "EXPIRED") {
            return voucher_status::expired;
        }
        return voucher_status::unknown;
    }

    auto is_terminal(voucher_status status) -> bool {
        return status == voucher_status::redeemed
            || status == voucher_status::revoked
            || status == voucher_status::expired;
    }

    auto can_be_redeemed(voucher_status status) -> bool {
        return status == voucher_status::issued;
    }

    auto description(voucher_status status) -> std::string {
        switch(status) {
            case voucher_status::issued:
                return "Voucher is active and ready for redemption";
            case voucher_status::redeemed:
                return "Voucher has been redeemed and cannot be reused";
            case voucher_status::revoked:
                return "Voucher has been revoked by the issuer";
            case voucher_status::expired:
                return "Voucher has expired and can no longer be redeemed";
            case voucher_status::unknown:
                break;
        }
        return "Voucher status is not recognised";
    }

    auto is_allowed_transition(voucher_status from, voucher_status to)
        -> bool {
        return from == voucher_status::issued && is_terminal(to);
    }
}
