/* Copyright (C) 2025 by Arm Limited. All rights reserved. */

#pragma once

#include "lib/AutoClosingFd.h"
#include "supervisor/disconnection_signal.h"
#include "supervisor/line_classifier.h"

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include <boost/asio/io_context.hpp>
#include <boost/asio/io_context_strand.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/streambuf.hpp>
#include <boost/system/error_code.hpp>

namespace adbcam::supervisor {
    /** Receives every classified line */
    using line_observer_t = std::function<void(classified_line_t const &)>;

    /**
     * Reads one output stream of one managed process, line by line, classifying each line.
     *
     * A disconnect line sets the shared disconnection signal and ends the monitor. End of stream or a read error
     * also end it; a read error does not set the signal.
     */
    class stream_monitor_t : public std::enable_shared_from_this<stream_monitor_t> {
    public:
        /** Lines longer than this are delivered in pieces */
        static constexpr std::size_t max_line_length = 64 * 1024;

        stream_monitor_t(boost::asio::io_context & io_context,
                         std::string process_name,
                         stream_kind_t stream,
                         lib::AutoClosingFd fd,
                         disconnection_signal_t & disconnection_signal,
                         classifier_rules_t rules,
                         line_observer_t observer);

        /** Begin reading on the io_context */
        void start();

        /** Stop reading; a pending read completes with operation_aborted */
        void cancel();

        /** @return true once the read loop has ended */
        [[nodiscard]] bool is_complete() const noexcept { return complete.load(std::memory_order_acquire); }

        [[nodiscard]] std::string const & process_name() const noexcept { return name; }
        [[nodiscard]] stream_kind_t stream_kind() const noexcept { return stream; }

    private:
        boost::asio::io_context::strand strand;
        boost::asio::posix::stream_descriptor stream_descriptor;
        boost::asio::streambuf buffer {max_line_length};
        std::string name;
        stream_kind_t stream;
        disconnection_signal_t & disconnection_signal;
        classifier_rules_t rules;
        line_observer_t observer;
        std::atomic<bool> complete {false};

        void do_read();
        void on_read(boost::system::error_code const & ec, std::size_t n);

        /** @return false if the monitor must stop reading */
        bool on_line(std::string_view raw_line);

        void finish();
    };
}
