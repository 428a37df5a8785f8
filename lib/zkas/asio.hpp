/* This file is part of the zk-account-soundness project.
 * Copyright (c) 2025 zk-account-soundness contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef ZK_ACCOUNT_SOUNDNESS_ASIO_HPP
#define ZK_ACCOUNT_SOUNDNESS_ASIO_HPP

#include <functional>
#include <memory>
#include <string>

namespace boost::asio {
    struct io_context;
}

namespace zk_account_soundness::asio {
    // Owns an io_context and the thread that runs it until the worker is destroyed
    struct worker {
        using action_type = std::function<void()>;

        static worker &get();
        explicit worker();
        ~worker();
        // schedules the action to be executed on the I/O thread
        void post(const action_type &act);
        boost::asio::io_context &io_context();
    private:
        struct impl;
        std::unique_ptr<impl> _impl;
    };
}

#endif // !ZK_ACCOUNT_SOUNDNESS_ASIO_HPP
