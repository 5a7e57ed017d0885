// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "tablet_endpoint.hpp"

#include <charconv>
#include <stdexcept>

namespace tablet {

    namespace {
        std::invalid_argument bad_endpoint(std::string_view text, std::string_view reason) {
            return std::invalid_argument("invalid tablet endpoint '" + std::string(text) + "': " + std::string(reason));
        }
    } // namespace

    tablet_endpoint parse_tablet_endpoint(std::string_view text) {
        tablet_endpoint endpoint;

        auto eq = text.find('=');
        if (eq == std::string_view::npos || eq == 0) {
            throw bad_endpoint(text, "expected shard=...");
        }
        endpoint.shard = std::string(text.substr(0, eq));
        auto rest = text.substr(eq + 1);

        auto first_at = rest.find('@');
        auto last_at = rest.rfind('@');
        if (first_at == std::string_view::npos || first_at == last_at || first_at == 0) {
            throw bad_endpoint(text, "expected alias@user@host");
        }
        endpoint.alias = std::string(rest.substr(0, first_at));

        // the password may contain '@', the host may not
        auto credentials = rest.substr(first_at + 1, last_at - first_at - 1);
        auto address = rest.substr(last_at + 1);

        auto colon = credentials.find(':');
        endpoint.username = std::string(credentials.substr(0, colon));
        if (colon != std::string_view::npos) {
            endpoint.password = std::string(credentials.substr(colon + 1));
        }
        if (endpoint.username.empty()) {
            throw bad_endpoint(text, "empty user name");
        }

        auto slash = address.find('/');
        if (slash != std::string_view::npos) {
            endpoint.database = std::string(address.substr(slash + 1));
            address = address.substr(0, slash);
        }

        auto port_sep = address.rfind(':');
        if (port_sep != std::string_view::npos) {
            auto port_text = address.substr(port_sep + 1);
            uint16_t port = 0;
            auto [ptr, ec] = std::from_chars(port_text.data(), port_text.data() + port_text.size(), port);
            if (ec != std::errc() || ptr != port_text.data() + port_text.size() || port == 0) {
                throw bad_endpoint(text, "bad port");
            }
            endpoint.port = port;
            address = address.substr(0, port_sep);
        }
        if (address.empty()) {
            throw bad_endpoint(text, "empty host");
        }
        endpoint.host = std::string(address);
        return endpoint;
    }

} // namespace tablet
