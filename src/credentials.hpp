#pragma once
#include "config.hpp"
#include "privilege.hpp"
#include "process.hpp"
#include <string>

namespace wakeprompt {

class CredentialProvider {
public:
    virtual ~CredentialProvider() = default;
    // Long-lived token for the target program. Throws SetupError.
    virtual std::string resolve(const ExecContext& ctx) = 0;
};

// Reads the token from the account's login keychain. When crossing into
// another account the lookup runs inside that account's session, where
// its keychain is unlocked.
class KeychainCredentialProvider : public CredentialProvider {
public:
    KeychainCredentialProvider(const Config& cfg, ProcessRunner& runner);
    std::string resolve(const ExecContext& ctx) override;

    Command lookup_command(const ExecContext& ctx) const;

private:
    const Config& cfg_;
    ProcessRunner& runner_;
};

} // namespace wakeprompt
