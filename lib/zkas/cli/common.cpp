/* This file is part of the zk-account-soundness project.
 * Copyright (c) 2025 zk-account-soundness contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <atomic>
#include <charconv>
#include <csignal>
#define BOOST_ASIO_HAS_STD_INVOKE_RESULT 1
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <zkas/asio.hpp>
#include <zkas/cli/common.hpp>
#include <zkas/http/endpoint.hpp>
#include <zkas/mutex.hpp>

namespace zk_account_soundness::cli::common {
    namespace net = boost::asio;

    namespace {
        uint64_t parse_uint(const std::string &name, const std::string &val)
        {
            uint64_t res = 0;
            const auto *end = val.data() + val.size();
            const auto [ptr, ec] = std::from_chars(val.data(), end, res);
            if (val.empty() || ec != std::errc {} || ptr != end)
                throw config_error("the value of --{} must be a non-negative integer but got '{}'", name, val);
            return res;
        }

        // a single place to look up a setting in all the sources ordered by their precedence
        struct setting_sources {
            setting_sources(const options &opts, const environment &env)
                : _opts { opts }, _env { env }, _file { _load(opts) }
            {
            }

            std::optional<std::string> string(const std::string &opt, const std::string_view key, const std::optional<std::string_view> env_name={}) const
            {
                if (auto val = opt_value(_opts, opt))
                    return val;
                if (auto val = _file->get_string(key))
                    return val;
                if (env_name) {
                    if (auto val = _env.get(std::string { *env_name }))
                        return val;
                }
                return {};
            }

            // block references may also be given as JSON numbers in the config file
            std::optional<std::string> block(const std::string &opt, const std::string_view key) const
            {
                if (auto val = opt_value(_opts, opt))
                    return val;
                if (const auto *jv = _file->find(key); jv && (jv->is_uint64() || jv->is_int64()))
                    return std::string { json::serialize(*jv) };
                return _file->get_string(key);
            }

            std::optional<uint64_t> uint(const std::string &opt, const std::string_view key) const
            {
                if (const auto val = opt_value(_opts, opt))
                    return parse_uint(opt, *val);
                return _file->get_uint(key);
            }
        private:
            const options &_opts;
            const environment &_env;
            std::unique_ptr<zk_account_soundness::config> _file;

            static std::unique_ptr<zk_account_soundness::config> _load(const options &opts)
            {
                if (const auto path = opt_value(opts, "config"); path)
                    return std::make_unique<config_file>(*path);
                return std::make_unique<config_json>();
            }
        };

        std::string validate_endpoint(const std::string &opt, const std::optional<std::string> &url)
        {
            if (!url)
                throw config_error("an RPC endpoint is required: use --{}", opt);
            try {
                http::endpoint::parse(*url);
            } catch (const std::exception &ex) {
                throw config_error("invalid RPC URL '{}' for --{}: {}", *url, opt, ex.what());
            }
            return *url;
        }

        chain::block_ref validate_block(const std::string &opt, const std::optional<std::string> &val)
        {
            if (!val)
                return chain::block_ref::latest();
            try {
                return chain::block_ref::from_string(*val);
            } catch (const std::exception &ex) {
                throw config_error("invalid block reference '{}' for --{}: {}", *val, opt, ex.what());
            }
        }

        chain::address_list validate_addresses(const options &opts)
        {
            chain::address_list addrs {};
            if (const auto it = opts.find("address"); it != opts.end()) {
                for (const auto &a: it->second) {
                    try {
                        addrs.emplace_back(chain::address::from_hex(a));
                    } catch (const std::exception &ex) {
                        throw config_error("invalid address '{}': {}", a, ex.what());
                    }
                }
            }
            if (addrs.empty())
                throw config_error("at least one --address is required");
            return addrs;
        }

        void resolve_transport(settings &s, const setting_sources &src, const options &opts)
        {
            s.addresses = validate_addresses(opts);
            const auto timeout = src.uint("timeout", "timeout").value_or(settings::default_timeout.count());
            if (timeout == 0 || timeout > static_cast<uint64_t>(settings::max_timeout.count()))
                throw config_error("the timeout must be between 1 and {} seconds but got {}", settings::max_timeout.count(), timeout);
            s.timeout = std::chrono::seconds { timeout };
            s.max_in_flight = src.uint("max-in-flight", "maxInFlight").value_or(settings::default_max_in_flight);
            if (s.max_in_flight == 0)
                throw config_error("the maximum number of in-flight requests must be positive");
            s.retries = src.uint("retries", "retries").value_or(settings::default_retries);
            if (s.retries > settings::max_retries)
                throw config_error("the number of retries must not exceed {} but got {}", settings::max_retries, s.retries);
            s.json = opt_flag(opts, "json");
        }

        void add_transport_opts(config &cmd)
        {
            cmd.opts.try_emplace("address", "an account address: 0x followed by 40 hex digits", std::optional<std::string> {}, false, true);
            cmd.opts.try_emplace("timeout", "the timeout of every RPC request in seconds", std::to_string(settings::default_timeout.count()));
            cmd.opts.try_emplace("max-in-flight", "the maximum number of concurrent RPC requests", std::to_string(settings::default_max_in_flight));
            cmd.opts.try_emplace("retries", "the number of retries after a connection failure", std::to_string(settings::default_retries));
            cmd.opts.try_emplace("config", "a JSON file with the default settings");
            cmd.opts.try_emplace("json", "print the report in JSON", std::optional<std::string> {}, true);
        }
    }

    environment capture_environment()
    {
        return environment::capture({ env_rpc_a, env_rpc_b });
    }

    void add_compare_opts(config &cmd)
    {
        cmd.opts.try_emplace("rpc-a", fmt::format("the URL of the first RPC endpoint, {} by default", env_rpc_a));
        cmd.opts.try_emplace("rpc-b", fmt::format("the URL of the second RPC endpoint, {} by default", env_rpc_b));
        cmd.opts.try_emplace("block-a", "a block number or tag to query the first endpoint at", "latest");
        cmd.opts.try_emplace("block-b", "a block number or tag to query the second endpoint at", "latest");
        add_transport_opts(cmd);
    }

    void add_state_opts(config &cmd)
    {
        cmd.opts.try_emplace("rpc", fmt::format("the URL of the RPC endpoint, {} by default", env_rpc_a));
        cmd.opts.try_emplace("block", "a block number or tag to query the endpoint at", "latest");
        add_transport_opts(cmd);
    }

    settings resolve_compare(const options &opts, const environment &env)
    {
        const setting_sources src { opts, env };
        settings s {};
        s.rpc_a = validate_endpoint("rpc-a", src.string("rpc-a", "rpcA", env_rpc_a));
        s.rpc_b = validate_endpoint("rpc-b", src.string("rpc-b", "rpcB", env_rpc_b));
        s.block_a = validate_block("block-a", src.block("block-a", "blockA"));
        s.block_b = validate_block("block-b", src.block("block-b", "blockB"));
        resolve_transport(s, src, opts);
        return s;
    }

    settings resolve_state(const options &opts, const environment &env)
    {
        const setting_sources src { opts, env };
        settings s {};
        s.rpc_a = validate_endpoint("rpc", src.string("rpc", "rpcA", env_rpc_a));
        s.block_a = validate_block("block", src.block("block", "blockA"));
        resolve_transport(s, src, opts);
        return s;
    }

    struct interrupt_guard::impl: std::enable_shared_from_this<impl> {
        impl(const action_type &on_interrupt, asio::worker &asio_worker)
            : _action { on_interrupt }, _asio_worker { asio_worker }
        {
        }

        void arm()
        {
            _signals.async_wait([self = shared_from_this()](const auto &ec, const int signo) {
                if (ec)
                    return;
                logger::warn("received signal {}, cancelling", signo);
                mutex::scoped_lock lk { self->_action_mutex };
                if (self->_armed) {
                    self->_triggered = true;
                    self->_action();
                }
            });
        }

        void disarm()
        {
            {
                mutex::scoped_lock lk { _action_mutex };
                _armed = false;
            }
            _asio_worker.post([self = shared_from_this()] {
                self->_signals.cancel();
            });
        }

        bool triggered() const
        {
            return _triggered.load();
        }
    private:
        const action_type _action;
        asio::worker &_asio_worker;
        net::signal_set _signals { _asio_worker.io_context(), SIGINT, SIGTERM };
        alignas(mutex::padding) mutex::unique_lock::mutex_type _action_mutex {};
        bool _armed = true;
        std::atomic_bool _triggered { false };
    };

    interrupt_guard::interrupt_guard(const action_type &on_interrupt)
        : interrupt_guard { on_interrupt, asio::worker::get() }
    {
    }

    interrupt_guard::interrupt_guard(const action_type &on_interrupt, asio::worker &asio_worker)
        : _impl { std::make_shared<impl>(on_interrupt, asio_worker) }
    {
        _impl->arm();
    }

    interrupt_guard::~interrupt_guard()
    {
        _impl->disarm();
    }

    bool interrupt_guard::triggered() const
    {
        return _impl->triggered();
    }
}
