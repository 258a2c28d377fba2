#include "credentials.hpp"
#include "errors.hpp"
#include "utils.hpp"

namespace wakeprompt {

KeychainCredentialProvider::KeychainCredentialProvider(const Config& cfg, ProcessRunner& runner)
    : cfg_(cfg), runner_(runner) {}

Command KeychainCredentialProvider::lookup_command(const ExecContext& ctx) const {
    Command cmd;
    cmd.program = "/usr/bin/security";
    cmd.args = {"find-generic-password", "-s", cfg_.credential_service, "-w"};
    if (ctx.crosses_session() && !ctx.account.user.empty()) {
        cmd.args.push_back("-a");
        cmd.args.push_back(ctx.account.user);
    }
    cmd.env["LANG"] = "C";
    cmd.capture = true;
    cmd.quiet = true;
    return run_as(ctx, cmd);
}

std::string KeychainCredentialProvider::resolve(const ExecContext& ctx) {
    auto result = runner_.run(lookup_command(ctx));
    std::string token = trim(result.output);
    if (!result.ok() || token.empty()) {
        throw SetupError("missing setup token; run " + cfg_.setup_hint);
    }
    return token;
}

} // namespace wakeprompt
