/* This file is part of the zk-account-soundness project.
 * Copyright (c) 2025 zk-account-soundness contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef ZK_ACCOUNT_SOUNDNESS_REPORT_RENDERER_HPP
#define ZK_ACCOUNT_SOUNDNESS_REPORT_RENDERER_HPP

#include <memory>
#include <string>
#include <zkas/compare/types.hpp>
#include <zkas/json.hpp>

namespace zk_account_soundness::report {
    enum class format {
        json, text
    };

    // the states of accounts observed at a single source
    struct state_report {
        struct entry {
            chain::address addr {};
            chain::fetch_result state {};
        };

        chain::source_ref source {};
        std::vector<entry> accounts {};
        std::chrono::system_clock::time_point timestamp {};
        double elapsed_seconds = 0.0;
    };

    // Turns reports into text. Rendering has no side effects, the caller decides where the text goes.
    struct renderer {
        virtual ~renderer() =default;

        std::string render(const compare::run_summary &summary) const
        {
            return _render_impl(summary);
        }

        std::string render(const state_report &report) const
        {
            return _render_impl(report);
        }
    private:
        virtual std::string _render_impl(const compare::run_summary &summary) const =0;
        virtual std::string _render_impl(const state_report &report) const =0;
    };

    struct json_renderer: renderer {
        static json::object to_json(const compare::run_summary &summary);
        static json::object to_json(const state_report &report);
    private:
        std::string _render_impl(const compare::run_summary &summary) const override;
        std::string _render_impl(const state_report &report) const override;
    };

    struct text_renderer: renderer {
    private:
        std::string _render_impl(const compare::run_summary &summary) const override;
        std::string _render_impl(const state_report &report) const override;
    };

    extern std::unique_ptr<renderer> make_renderer(format out_format);
    extern std::string render(const compare::run_summary &summary, format out_format);
    extern std::string render(const state_report &report, format out_format);
}

#endif // !ZK_ACCOUNT_SOUNDNESS_REPORT_RENDERER_HPP
