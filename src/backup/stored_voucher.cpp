// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "stored_voucher.hpp"

#include "util/common/clock.hpp"

#include <tuple>

namespace evoucher::backup {
    stored_voucher::stored_voucher(signed_voucher voucher,
                                   int64_t added_at,
                                   std::optional<std::string> label)
        : m_voucher(std::move(voucher)),
          m_added_at(added_at),
          m_user_label(std::move(label)) {}

    stored_voucher::stored_voucher(signed_voucher voucher,
                                   std::optional<std::string> label)
        : stored_voucher(std::move(voucher), unix_time_now(), std::move(label)) {
    }

    void stored_voucher::mark_backed_up(int64_t now) {
        m_last_backup_at = now;
    }

    void stored_voucher::mark_backed_up() {
        mark_backed_up(unix_time_now());
    }

    void stored_voucher::update_status(voucher_status status, int64_t now) {
        m_cached_status = status;
        m_status_updated_at = now;
    }

    void stored_voucher::update_status(voucher_status status) {
        update_status(status, unix_time_now());
    }

    auto stored_voucher::needs_backup() const -> bool {
        if(!m_last_backup_at.has_value()) {
            return true;
        }
        return m_added_at > m_last_backup_at.value();
    }

    auto stored_voucher::is_status_stale(int64_t threshold_seconds,
                                         int64_t now) const -> bool {
        if(!m_status_updated_at.has_value()) {
            return true;
        }
        return now - m_status_updated_at.value() > threshold_seconds;
    }

    auto stored_voucher::is_status_stale(int64_t threshold_seconds) const
        -> bool {
        return is_status_stale(threshold_seconds, unix_time_now());
    }

    auto stored_voucher::voucher_id() const -> const voucher_id_t& {
        return m_voucher.voucher_id();
    }

    auto stored_voucher::amount() const -> int64_t {
        return m_voucher.face_value();
    }

    auto stored_voucher::unit() const -> const std::string& {
        return m_voucher.unit();
    }

    auto stored_voucher::expires_at() const -> const std::optional<int64_t>& {
        return m_voucher.expires_at();
    }

    auto stored_voucher::is_expired() const -> bool {
        return m_voucher.is_expired();
    }

    auto stored_voucher::operator==(const stored_voucher& rhs) const -> bool {
        return std::tie(m_voucher,
                        m_added_at,
                        m_last_backup_at,
                        m_cached_status,
                        m_status_updated_at,
                        m_user_label)
            == std::tie(rhs.m_voucher,
                        rhs.m_added_at,
                        rhs.m_last_backup_at,
                        rhs.m_cached_status,
                        rhs.m_status_updated_at,
                        rhs.m_user_label);
    }
}
