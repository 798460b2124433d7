#include "core/log.hpp"
#include "core/types.hpp"
#include "fuse/fuse_bridge.hpp"
#include "lua/config_loader.hpp"
#include "lua/lua_state.hpp"
#include "lua/project_manifest.hpp"
#include "overlay/overlay_filesystem.hpp"
#include "overlay/permission_oracle.hpp"
#include "overlay/project_registry.hpp"
#include "vfs/directory_store.hpp"

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <spdlog/spdlog.h>

static void print_usage() {
    std::cout << "blueprintfs v0.1.0\n"
              << "Project folders that grow from templates on first write\n\n"
              << "Usage:\n"
              << "  bpfs [options]\n\n"
              << "Options:\n"
              << "  --config <file>        Lua mount configuration\n"
              << "  --store <dir>          Physical store root\n"
              << "  --mount <dir>          Mount point\n"
              << "  --templates <dir>      Templates root (default: <project>/Templates)\n"
              << "  --projects-dir <name>  Project collection name (default: projects)\n"
              << "  --background           Detach after mounting\n"
              << "  --verbose              Debug-level logging\n"
              << "  --log <file>           Also log to a file\n"
              << "  --dump-tree <project>  Print a project's potential tree and exit\n"
              << "  --help                 Show this help message\n";
}

/// Command-line values; each one set overrides the config file.
struct CommandLine {
    bpfs::fs::path config_file;
    std::optional<bpfs::fs::path> store_root;
    std::optional<bpfs::fs::path> mount_point;
    std::optional<bpfs::fs::path> templates_root;
    std::optional<std::string> projects_dir;
    std::optional<bpfs::fs::path> log_file;
    bool background = false;
    bool verbose = false;
    std::string dump_project;
};

static CommandLine parse_args(int argc, char* argv[]) {
    CommandLine args;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            args.config_file = argv[++i];
        } else if (std::strcmp(argv[i], "--store") == 0 && i + 1 < argc) {
            args.store_root = bpfs::fs::path(argv[++i]);
        } else if (std::strcmp(argv[i], "--mount") == 0 && i + 1 < argc) {
            args.mount_point = bpfs::fs::path(argv[++i]);
        } else if (std::strcmp(argv[i], "--templates") == 0 && i + 1 < argc) {
            args.templates_root = bpfs::fs::path(argv[++i]);
        } else if (std::strcmp(argv[i], "--projects-dir") == 0 &&
                   i + 1 < argc) {
            args.projects_dir = std::string(argv[++i]);
        } else if (std::strcmp(argv[i], "--log") == 0 && i + 1 < argc) {
            args.log_file = bpfs::fs::path(argv[++i]);
        } else if (std::strcmp(argv[i], "--dump-tree") == 0 && i + 1 < argc) {
            args.dump_project = argv[++i];
        } else if (std::strcmp(argv[i], "--background") == 0) {
            args.background = true;
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            args.verbose = true;
        } else if (std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            std::exit(0);
        } else {
            spdlog::error("Unknown or incomplete option: {}", argv[i]);
            print_usage();
            std::exit(2);
        }
    }

    return args;
}

static void apply_overrides(const CommandLine& args,
                            bpfs::lua::MountConfig& config) {
    if (args.store_root) config.store_root = *args.store_root;
    if (args.mount_point) config.mount_point = *args.mount_point;
    if (args.templates_root) config.templates_root = *args.templates_root;
    if (args.projects_dir) config.projects_dir = *args.projects_dir;
    if (args.log_file) config.log_file = *args.log_file;
    if (args.background) config.foreground = false;
    if (args.verbose) config.verbose = true;
}

static void print_tree(const bpfs::overlay::PotentialTree& node, int depth) {
    for (const auto& name : node.names()) {
        std::cout << std::string(static_cast<size_t>(depth) * 2, ' ') << name
                  << "/\n";
        print_tree(*node.child(name), depth + 1);
    }
}

static int dump_tree(bpfs::overlay::ProjectRegistry& registry,
                     const std::string& project) {
    auto session = registry.session(project);
    if (!session) {
        spdlog::error("No such project: {}", project);
        return 1;
    }

    std::cout << project << " (templates root: "
              << session->templates_root.string() << ")\n";
    for (const auto& id : session->report.loaded) {
        std::cout << "  template " << id << "\n";
    }
    for (const auto& id : session->report.missing) {
        std::cout << "  template " << id << " (missing)\n";
    }
    for (const auto& id : session->report.invalid) {
        std::cout << "  template '" << id << "' (invalid)\n";
    }
    print_tree(session->tree, 1);
    return 0;
}

static int run(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);

    bpfs::lua::MountConfig config;
    if (!args.config_file.empty()) {
        bpfs::lua::LuaState state;
        bpfs::lua::ConfigLoader loader;
        auto loaded = loader.load_mount_config(state, args.config_file, config);
        if (!loaded) {
            spdlog::error("Config failed: {}", loaded.error().message);
            return 1;
        }
    }
    apply_overrides(args, config);

    if (!config.log_file.empty() || config.verbose) {
        bpfs::log::init(config.log_file, config.verbose);
    }

    auto valid = config.validate();
    if (!valid) {
        spdlog::error("{}", valid.error().message);
        return 1;
    }

    spdlog::info("Store:     {}", config.store_root.string());
    spdlog::info("Templates: {}", config.templates_root.empty()
                                      ? std::string("<project>/Templates")
                                      : config.templates_root.string());
    spdlog::info("Projects:  /{}", config.projects_dir);

    std::error_code ec;
    bpfs::fs::create_directories(config.store_root / config.projects_dir, ec);
    if (ec) {
        spdlog::error("Cannot prepare store {}: {}", config.store_root.string(),
                      ec.message());
        return 1;
    }

    bpfs::vfs::DirectoryStore store(config.store_root);
    bpfs::lua::LuaProjectConfig manifests;

    bpfs::overlay::ProjectRegistry::Options registry_options;
    registry_options.collection = config.projects_dir;
    registry_options.templates_root = config.templates_root;
    registry_options.default_templates = config.default_templates;
    bpfs::overlay::ProjectRegistry registry(store, manifests,
                                            std::move(registry_options));

    if (!args.dump_project.empty()) {
        return dump_tree(registry, args.dump_project);
    }

    if (config.mount_point.empty()) {
        spdlog::error("No mount point given. Use --mount or set mountpoint.");
        return 1;
    }

    std::unique_ptr<bpfs::overlay::RulePermissionOracle> oracle;
    if (!config.permissions.empty()) {
        oracle = std::make_unique<bpfs::overlay::RulePermissionOracle>(
            config.permissions, config.users);
        spdlog::info("Permission rules: {}, users: {}", oracle->rule_count(),
                     oracle->user_count());
    } else if (!config.users.empty()) {
        spdlog::warn("users table ignored: no permission rules configured");
    }

    bpfs::overlay::OverlayFilesystem filesystem(
        store, registry, oracle.get(), nullptr, config.memo_capacity);

    bpfs::fuse::MountOptions mount;
    mount.mount_point = config.mount_point;
    mount.foreground = config.foreground;
    return bpfs::fuse::run(filesystem, mount);
}

int main(int argc, char* argv[]) {
    bpfs::log::init();

    int status = 1;
    try {
        status = run(argc, argv);
    } catch (const std::exception& e) {
        spdlog::critical("Fatal: {}", e.what());
    }

    bpfs::log::shutdown();
    return status;
}
