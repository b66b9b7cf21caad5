// credential_table.hpp - Server credential table for NetGauge
// Copyright (C) 2025 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <netgauge/common/auth/token.hpp>
#include <netgauge/common/error.hpp>

namespace NetGauge::Auth {
    // Environment variable with the server's "clientID:hexsecret,..." list; overrides the TOKENS config key
    inline constexpr const char* kServerTokensEnv = "NETGAUGE_TOKENS";
    // Environment variable with the client's "clientID:hexsecret"; overrides the KEY config key
    inline constexpr const char* kClientKeyEnv = "NETGAUGE_KEY";

    // clientID -> secret. Built once at startup, read-only afterwards, shared by every session.
    class CredentialTable {
        public:
            explicit CredentialTable(SignatureScheme scheme = SignatureScheme::SHA512_CONCAT) : mScheme(scheme) {}

            // Parse "1:3312a18b,2:666bf6a2". TOKEN_FORMAT on a bad pair, CONFIG when no pair is given.
            static Result<CredentialTable> parse(const std::string& value, SignatureScheme scheme = SignatureScheme::SHA512_CONCAT);

            // Server credentials from NETGAUGE_TOKENS or the TOKENS/SIGNATURE config keys
            static Result<CredentialTable> load(const std::unordered_map<std::string, std::string>& config);

            void insert(uint16_t clientID, Secret secret);
            // nullptr when the client is unknown
            const Secret* find(uint16_t clientID) const;

            size_t size() const { return mSecrets.size(); }
            bool empty() const { return mSecrets.empty(); }
            SignatureScheme scheme() const { return mScheme; }

        private:
            SignatureScheme mScheme;
            std::unordered_map<uint16_t, Secret> mSecrets;
    };

    // Client credential from NETGAUGE_KEY or the KEY/SIGNATURE config keys
    Result<Token> loadClientToken(const std::unordered_map<std::string, std::string>& config);
}
