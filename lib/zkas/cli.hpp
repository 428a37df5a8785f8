/* This file is part of the zk-account-soundness project.
 * Copyright (c) 2025 zk-account-soundness contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef ZK_ACCOUNT_SOUNDNESS_CLI_HPP
#define ZK_ACCOUNT_SOUNDNESS_CLI_HPP

#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <zkas/logger.hpp>

namespace zk_account_soundness::cli {
    // bad command line or configuration, detected before any work is done
    static constexpr int exit_usage_error = 1;
    // an unexpected failure after the command has started
    static constexpr int exit_failure = 3;

    using arguments = std::vector<std::string>;
    // every occurrence of an option in the order of the command line, flags have no values
    using options = std::map<std::string, std::vector<std::string>>;

    struct option_config {
        std::string desc {};
        // shown in the usage, the commands apply their defaults after merging the other sources
        std::optional<std::string> default_value {};
        bool flag = false;
        bool repeatable = false;
    };
    using option_config_map = std::map<std::string, option_config>;

    struct config {
        std::string name {};
        std::string desc {};
        option_config_map opts {};

        std::string make_usage() const
        {
            const std::string opt_info { opts.empty() ? "" : "[options]" };
            return fmt::format("{} - {}", opt_info, desc);
        }

        std::string make_help() const
        {
            std::string usage = fmt::format("usage: {} {}", name, make_usage());
            if (!opts.empty()) {
                usage += fmt::format("\n{} supports the following options:", name);
                for (const auto &[opt_name, cfg]: opts) {
                    const auto arg_info = cfg.flag ? "" : "=<value>";
                    const auto rep_info = cfg.repeatable ? " (repeatable)" : "";
                    if (cfg.default_value)
                        usage += fmt::format("\n    --{}{}{} ({} by default) - {}", opt_name, arg_info, rep_info, *cfg.default_value, cfg.desc);
                    else
                        usage += fmt::format("\n    --{}{}{} - {}", opt_name, arg_info, rep_info, cfg.desc);
                }
            }
            return usage;
        }
    };

    struct parse_result {
        arguments args {};
        options opts {};
    };

    // the last value of an option, or nothing when it is not present
    inline std::optional<std::string> opt_value(const options &opts, const std::string &name)
    {
        if (const auto it = opts.find(name); it != opts.end() && !it->second.empty())
            return it->second.back();
        return {};
    }

    inline bool opt_flag(const options &opts, const std::string &name)
    {
        return opts.contains(name);
    }

    // a problem with the command line, reported together with the usage of the command
    struct usage_error: config_error {
        using config_error::config_error;
    };

    struct command {
        using command_list = std::vector<std::shared_ptr<command>>;

        static const command_list &registry()
        {
            return _registry();
        }

        static std::shared_ptr<command> reg(std::shared_ptr<command> &&cmd)
        {
            return _registry().emplace_back(std::move(cmd));
        }

        virtual ~command() =default;

        // returns the exit code of the process
        virtual int run(const arguments &args, const options &opts) const =0;
        virtual void configure(config &meta) const =0;

        // accepts --name=value as well as --name value
        parse_result parse(const config &cfg, const arguments &args) const
        {
            parse_result pr {};
            for (size_t i = 0; i < args.size(); ++i) {
                const auto &arg = args[i];
                if (arg.substr(0, 2) != "--") {
                    pr.args.emplace_back(arg);
                    continue;
                }
                std::string name = arg.substr(2);
                std::optional<std::string> val {};
                if (const auto eq_pos = arg.find('=', 2); eq_pos != arg.npos) {
                    val = arg.substr(eq_pos + 1);
                    name = arg.substr(2, eq_pos - 2);
                }
                const auto cfg_it = cfg.opts.find(name);
                if (cfg_it == cfg.opts.end())
                    throw usage_error("unknown option '--{}'", name);
                const auto &opt_cfg = cfg_it->second;
                if (opt_cfg.flag) {
                    if (val)
                        throw usage_error("the option '--{}' does not take a value", name);
                } else if (!val) {
                    if (i + 1 >= args.size())
                        throw usage_error("the option '--{}' requires a value", name);
                    val = args[++i];
                }
                const auto [opt_it, opt_created] = pr.opts.try_emplace(name);
                if (!opt_created && !opt_cfg.repeatable)
                    throw usage_error("duplicate option specification '{}'", arg);
                if (val)
                    opt_it->second.emplace_back(std::move(*val));
            }
            if (!pr.args.empty())
                throw usage_error("unexpected argument '{}'", pr.args.front());
            return pr;
        }
    private:
        static command_list &_registry()
        {
            static command_list l {};
            return l;
        }
    };

    struct command_meta {
        std::shared_ptr<command> cmd {};
        config cfg {};
    };

    extern int run(const int argc, const char **argv, const command::command_list &command_list);
    extern int run(const int argc, const char **argv);
}

#endif // !ZK_ACCOUNT_SOUNDNESS_CLI_HPP
