/* This file is part of the zk-account-soundness project.
 * Copyright (c) 2025 zk-account-soundness contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <zkas/cli.hpp>
#include <zkas/timer.hpp>

namespace zk_account_soundness::cli {
    int run(const int argc, const char **argv, const command::command_list &command_list)
    {
        std::set_terminate([]() {
            std::cerr << "std::terminate called; terminating\n";
            std::abort();
        });
        std::map<std::string, command_meta> commands {};
        for (const auto &cmd: command_list) {
            command_meta meta { cmd };
            cmd->configure(meta.cfg);
            if (const auto [it, created] = commands.try_emplace(meta.cfg.name, std::move(meta)); !created) [[unlikely]]
                throw error("multiple definitions for {}", it->first);
        }
        if (argc < 2) {
            std::cerr << "Usage: <command> [<arg> ...], where <command> is one of:\n" ;
            for (const auto &[name, cmd]: commands)
                std::cerr << fmt::format("    {} {}\n", cmd.cfg.name, cmd.cfg.make_usage());
            return exit_usage_error;
        }

        const std::string cmd { argv[1] };
        logger::debug("run {}", cmd);
        const auto cmd_it = commands.find(cmd);
        if (cmd_it == commands.end()) {
            logger::error("Unknown command {}", cmd);
            return exit_usage_error;
        }

        arguments args {};
        for (int i = 2; i < argc; ++i)
            args.emplace_back(argv[i]);
        const auto &meta = cmd_it->second;
        try {
            timer t { fmt::format("run {}", cmd), logger::level::debug };
            const auto pr = meta.cmd->parse(meta.cfg, args);
            return meta.cmd->run(pr.args, pr.opts);
        } catch (const usage_error &ex) {
            logger::error("{}: {}", cmd, ex.what());
            std::cerr << meta.cfg.make_help() << '\n';
            return exit_usage_error;
        } catch (const config_error &ex) {
            logger::error("{}: configuration error: {}", cmd, ex.what());
            return exit_usage_error;
        } catch (const std::exception &ex) {
            logger::error("{} failed: {}", cmd, ex.what());
            return exit_failure;
        }
    }

    int run(const int argc, const char **argv)
    {
        return run(argc, argv, command::registry());
    }
}
