// credential_table.cpp - Server credential table for NetGauge
// Copyright (C) 2025 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#include <netgauge/common/auth/credential_table.hpp>

#include <cstdlib>
#include <netgauge/common/utils.hpp>

namespace NetGauge::Auth {
    namespace {
        std::string trimList(const std::string& value, const char* chars) {
            size_t start = value.find_first_not_of(chars);
            if (start == std::string::npos) {
                return "";
            }
            size_t end = value.find_last_not_of(chars);
            return value.substr(start, end - start + 1);
        }

        // Environment wins over the config file
        std::string lookup(const std::unordered_map<std::string, std::string>& config, const char* env, const std::string& key) {
            if (const char* value = std::getenv(env); value != nullptr && *value != '\0') {
                return value;
            }
            auto it = config.find(key);
            return it == config.end() ? std::string() : it->second;
        }

        Result<SignatureScheme> schemeFrom(const std::unordered_map<std::string, std::string>& config) {
            auto it = config.find("SIGNATURE");
            return parseSignatureScheme(it == config.end() ? std::string() : it->second);
        }
    }

    Result<CredentialTable> CredentialTable::parse(const std::string& value, SignatureScheme scheme) {
        std::string list = trimList(value, ", ");
        if (list.empty()) {
            return Error(ErrorKind::CONFIG, "no client credentials configured");
        }

        CredentialTable table(scheme);
        size_t start = 0;
        while (start <= list.size()) {
            size_t comma = list.find(',', start);
            std::string pair = trimList(list.substr(start, comma == std::string::npos ? std::string::npos : comma - start), " ");

            auto token = Token::parse(pair, scheme);
            if (!token) {
                return token.error();
            }
            table.insert(token.value().clientID(), token.value().secret());

            if (comma == std::string::npos) {
                break;
            }
            start = comma + 1;
        }

        return table;
    }

    Result<CredentialTable> CredentialTable::load(const std::unordered_map<std::string, std::string>& config) {
        auto scheme = schemeFrom(config);
        if (!scheme) {
            return scheme.error();
        }
        return parse(lookup(config, kServerTokensEnv, "TOKENS"), scheme.value());
    }

    void CredentialTable::insert(uint16_t clientID, Secret secret) {
        mSecrets[clientID] = std::move(secret);
    }

    const Secret* CredentialTable::find(uint16_t clientID) const {
        auto it = mSecrets.find(clientID);
        return it == mSecrets.end() ? nullptr : &it->second;
    }

    Result<Token> loadClientToken(const std::unordered_map<std::string, std::string>& config) {
        auto scheme = schemeFrom(config);
        if (!scheme) {
            return scheme.error();
        }

        std::string pair = trimList(lookup(config, kClientKeyEnv, "KEY"), " ");
        if (pair.empty()) {
            return Error(ErrorKind::CONFIG, std::string("auth required: set ") + kClientKeyEnv + " or KEY in the client config");
        }
        return Token::parse(pair, scheme.value());
    }
}
