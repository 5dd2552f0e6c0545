#include "auth/CredentialResolver.hpp"
#include "config/ConfigRegistry.hpp"
#include "identity/KeyDeriver.hpp"
#include "log/Registry.hpp"
#include "storage/SessionStore.hpp"
#include "types/errors.hpp"
#include "util/timestamp.hpp"

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include <string>
#include <vector>

using namespace rh;

namespace {

constexpr int EXIT_USAGE = 2;

void usage() {
    fmt::print(stderr,
               "usage: rehydra [-c config.yaml] <command> [args...]\n"
               "\n"
               "commands:\n"
               "  key     <kind> <identity>   print the session key\n"
               "  status  <kind> <identity>   VALID, ABSENT or INVALID plus metadata\n"
               "  path    <kind> <identity>   print the snapshot path when valid\n"
               "  cleanup <kind> <identity>   delete the stored session\n"
               "  whoami  <kind>              show which credentials a test would use\n"
               "  config                      dump the effective configuration\n"
               "\n"
               "kinds: {}\n", types::validSessionKindsList());
}

int cmdStatus(const storage::SessionStore& store, const types::SessionIdentity& id) {
    const auto rec = store.record(id);
    const auto meta = store.readMetadata(id);

    if (store.isValid(id)) fmt::print("VALID    {}\n", rec.key);
    else if (!meta) fmt::print("ABSENT   {}\n", rec.key);
    else fmt::print("INVALID  {}\n", rec.key);

    if (meta) {
        fmt::print("  kind:     {}\n", types::to_string(meta->kind));
        fmt::print("  identity: {}\n", meta->identity);
        fmt::print("  created:  {}\n", util::toIso8601(meta->createdAt));
        fmt::print("  expires:  {}\n", util::toIso8601(meta->expiresAt));
    }
    fmt::print("  snapshot: {}\n", rec.snapshotPath.string());
    return 0;
}

std::shared_ptr<auth::TestDataSource> testDataFor(const config::CredentialsConfig& cfg) {
    if (cfg.test_data_file.empty()) return nullptr;
    return std::make_shared<auth::YamlTestData>(cfg.test_data_file, cfg.test_name, cfg.data_key);
}

int cmdWhoami(const types::SessionKind kind) {
    const auto& cfg = config::ConfigRegistry::get().credentials;
    const auth::CredentialResolver resolver(cfg, std::make_shared<auth::ProcessEnvironment>(), testDataFor(cfg));

    try {
        const auto id = resolver.resolve(kind);
        fmt::print("{} {} {}\n", types::to_string(id.kind), id.identity, identity::deriveKey(id.kind, id.identity));
        return 0;
    } catch (const types::MissingCredentials& e) {
        fmt::print(stderr, "rehydra: {}\n", e.what());
        return 1;
    }
}

int run(const std::vector<std::string>& args) {
    const auto& cmd = args[0];

    if (cmd == "config") {
        fmt::print("{}\n", nlohmann::json(config::ConfigRegistry::get()).dump(2));
        return 0;
    }

    if (cmd == "whoami") {
        if (args.size() != 2) {
            fmt::print(stderr, "rehydra: 'whoami' expects <kind>\n");
            usage();
            return EXIT_USAGE;
        }
        try {
            return cmdWhoami(types::sessionKindFromString(args[1]));
        } catch (const types::InvalidSessionKind& e) {
            fmt::print(stderr, "rehydra: {}\n", e.what());
            return EXIT_USAGE;
        }
    }

    if (cmd != "key" && cmd != "status" && cmd != "path" && cmd != "cleanup") {
        fmt::print(stderr, "rehydra: unknown command '{}'\n", cmd);
        usage();
        return EXIT_USAGE;
    }

    if (args.size() != 3) {
        fmt::print(stderr, "rehydra: '{}' expects <kind> <identity>\n", cmd);
        usage();
        return EXIT_USAGE;
    }

    types::SessionKind kind;
    try {
        kind = types::sessionKindFromString(args[1]);
    } catch (const types::InvalidSessionKind& e) {
        fmt::print(stderr, "rehydra: {}\n", e.what());
        return EXIT_USAGE;
    }

    if (cmd == "key") {
        fmt::print("{}\n", identity::deriveKey(kind, args[2]));
        return 0;
    }

    const types::SessionIdentity id{kind, args[2], {}};
    storage::SessionStore store(config::ConfigRegistry::get().store);

    if (cmd == "status") return cmdStatus(store, id);

    if (cmd == "path") {
        const auto path = store.load(id);
        if (!path) return 1;
        fmt::print("{}\n", path->string());
        return 0;
    }

    store.cleanup(id);
    store.waitForCleanup();
    log::Registry::cli()->info("[CLI] Removed stored session {}", store.record(id).key);
    return 0;
}

}

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    std::filesystem::path configPath = config::ConfigRegistry::DEFAULT_CONFIG_PATH;
    bool explicitConfig = false;

    if (!args.empty() && (args[0] == "-h" || args[0] == "--help")) {
        usage();
        return 0;
    }

    if (!args.empty() && args[0] == "-c") {
        if (args.size() < 2) {
            usage();
            return EXIT_USAGE;
        }
        configPath = args[1];
        explicitConfig = true;
        args.erase(args.begin(), args.begin() + 2);
    }

    if (args.empty()) {
        usage();
        return EXIT_USAGE;
    }

    try {
        config::ConfigRegistry::init(configPath, explicitConfig);
        log::Registry::init(config::ConfigRegistry::get().logging);
    } catch (const config::ConfigNotFound& e) {
        fmt::print(stderr, "rehydra: {}\n", e.what());
        return EXIT_USAGE;
    } catch (const std::exception& e) {
        fmt::print(stderr, "rehydra: failed to load configuration from {}: {}\n", configPath.string(), e.what());
        return 1;
    }

    try {
        return run(args);
    } catch (const std::exception& e) {
        log::Registry::cli()->error("[CLI] {}", e.what());
        return 1;
    }
}
