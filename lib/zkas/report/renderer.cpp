/* This file is part of the zk-account-soundness project.
 * Copyright (c) 2025 zk-account-soundness contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <iterator>
#include <zkas/report/renderer.hpp>

namespace zk_account_soundness::report {
    namespace {
        json::value balance_json(const chain::fetch_result &r)
        {
            if (chain::ok(r))
                return json::string { std::get<chain::account_state>(r).balance.str() };
            return nullptr;
        }

        json::value nonce_json(const chain::fetch_result &r)
        {
            if (chain::ok(r))
                return std::get<chain::account_state>(r).nonce;
            return nullptr;
        }

        json::value error_json(const chain::fetch_result &r)
        {
            if (chain::ok(r))
                return nullptr;
            return json::string { fmt::format("{}", std::get<chain::fetch_error>(r)) };
        }

        double round_elapsed(const double secs)
        {
            return static_cast<double>(static_cast<int64_t>(secs * 1000 + 0.5)) / 1000;
        }

        std::string balance_text(const chain::fetch_result &r)
        {
            if (chain::ok(r))
                return std::get<chain::account_state>(r).balance.str();
            return "ERR";
        }

        std::string nonce_text(const chain::fetch_result &r)
        {
            if (chain::ok(r))
                return std::to_string(std::get<chain::account_state>(r).nonce);
            return "ERR";
        }

        const char *outcome_marker(const compare::outcome o)
        {
            switch (o) {
                case compare::outcome::match: return "✅";
                case compare::outcome::fetch_error: return "⚠️";
                default: return "❌";
            }
        }
    }

    json::object json_renderer::to_json(const compare::run_summary &summary)
    {
        json::array accounts {};
        accounts.reserve(summary.results.size());
        for (const auto &r: summary.results) {
            accounts.emplace_back(json::object {
                { "address", r.addr.to_string() },
                { "balanceA", balance_json(r.state_a) },
                { "balanceB", balance_json(r.state_b) },
                { "nonceA", nonce_json(r.state_a) },
                { "nonceB", nonce_json(r.state_b) },
                { "outcome", compare::outcome_name(r.verdict) },
                { "errorA", error_json(r.state_a) },
                { "errorB", error_json(r.state_b) }
            });
        }
        const auto cnt = summary.counts();
        return json::object {
            { "sourceA", summary.source_a.endpoint },
            { "sourceB", summary.source_b.endpoint },
            { "blockA", summary.source_a.block.to_string() },
            { "blockB", summary.source_b.block.to_string() },
            { "timestamp", format_utc(summary.timestamp) },
            { "accounts", std::move(accounts) },
            { "overallStatus", compare::run_status_name(summary.status) },
            { "counts", json::object { { "match", cnt.match }, { "mismatch", cnt.mismatch }, { "error", cnt.error } } },
            { "elapsedSeconds", round_elapsed(summary.elapsed_seconds) }
        };
    }

    json::object json_renderer::to_json(const state_report &report)
    {
        json::array accounts {};
        accounts.reserve(report.accounts.size());
        for (const auto &e: report.accounts) {
            accounts.emplace_back(json::object {
                { "address", e.addr.to_string() },
                { "balance", balance_json(e.state) },
                { "nonce", nonce_json(e.state) },
                { "error", error_json(e.state) }
            });
        }
        return json::object {
            { "source", report.source.endpoint },
            { "block", report.source.block.to_string() },
            { "timestamp", format_utc(report.timestamp) },
            { "accounts", std::move(accounts) },
            { "elapsedSeconds", round_elapsed(report.elapsed_seconds) }
        };
    }

    std::string json_renderer::_render_impl(const compare::run_summary &summary) const
    {
        return json::serialize_pretty(to_json(summary)) + "\n";
    }

    std::string json_renderer::_render_impl(const state_report &report) const
    {
        return json::serialize_pretty(to_json(report)) + "\n";
    }

    std::string text_renderer::_render_impl(const compare::run_summary &summary) const
    {
        std::string out {};
        auto it = std::back_inserter(out);
        fmt::format_to(it, "🔧 zk-account-soundness\n");
        fmt::format_to(it, "🔗 RPC A: {}\n", summary.source_a.endpoint);
        fmt::format_to(it, "🔗 RPC B: {}\n", summary.source_b.endpoint);
        fmt::format_to(it, "🧱 Block A: {} | Block B: {}\n", summary.source_a.block, summary.source_b.block);
        fmt::format_to(it, "👥 Accounts: {}\n", summary.results.size());
        fmt::format_to(it, "🕒 Comparison Timestamp: {}\n", format_utc(summary.timestamp));
        fmt::format_to(it, "\n📊 Results:\n");
        for (const auto &r: summary.results) {
            fmt::format_to(it, "  • {}: Balance {} vs {}, TXs {} vs {} → {} {}\n", r.addr,
                balance_text(r.state_a), balance_text(r.state_b), nonce_text(r.state_a), nonce_text(r.state_b),
                outcome_marker(r.verdict), r.verdict);
            if (!chain::ok(r.state_a))
                fmt::format_to(it, "      A: {}\n", std::get<chain::fetch_error>(r.state_a));
            if (!chain::ok(r.state_b))
                fmt::format_to(it, "      B: {}\n", std::get<chain::fetch_error>(r.state_b));
        }
        const auto cnt = summary.counts();
        if (summary.status == compare::run_status::ok)
            fmt::format_to(it, "\n🎯 Account states match across both sources.\n");
        else
            fmt::format_to(it, "\n🚨 {} account(s) differ between the two sources.\n", cnt.mismatch + cnt.error);
        fmt::format_to(it, "⏱️ Completed in {:.2f} seconds: {} match, {} mismatch, {} error\n",
            summary.elapsed_seconds, cnt.match, cnt.mismatch, cnt.error);
        return out;
    }

    std::string text_renderer::_render_impl(const state_report &report) const
    {
        std::string out {};
        auto it = std::back_inserter(out);
        fmt::format_to(it, "🔗 RPC: {}\n", report.source.endpoint);
        fmt::format_to(it, "🧱 Block: {}\n", report.source.block);
        fmt::format_to(it, "🕒 Timestamp: {}\n\n", format_utc(report.timestamp));
        for (const auto &e: report.accounts) {
            if (chain::ok(e.state))
                fmt::format_to(it, "  • {}: Balance {}, TXs {}\n", e.addr, balance_text(e.state), nonce_text(e.state));
            else
                fmt::format_to(it, "  • {}: ⚠️ {}\n", e.addr, std::get<chain::fetch_error>(e.state));
        }
        fmt::format_to(it, "⏱️ Completed in {:.2f} seconds\n", report.elapsed_seconds);
        return out;
    }

    std::unique_ptr<renderer> make_renderer(const format out_format)
    {
        switch (out_format) {
            case format::json: return std::make_unique<json_renderer>();
            case format::text: return std::make_unique<text_renderer>();
            default: throw error("unsupported report format: {}", static_cast<int>(out_format));
        }
    }

    std::string render(const compare::run_summary &summary, const format out_format)
    {
        return make_renderer(out_format)->render(summary);
    }

    std::string render(const state_report &report, const format out_format)
    {
        return make_renderer(out_format)->render(report);
    }
}
