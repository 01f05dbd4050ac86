/* Copyright (C) 2025 by Arm Limited. All rights reserved. */

#include "supervisor/stream_monitor.h"

#include "Logging.h"

#include <algorithm>
#include <string>
#include <utility>

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/read_until.hpp>

namespace adbcam::supervisor {
    namespace {
        std::string_view buffer_contents(boost::asio::streambuf const & buffer, std::size_t n)
        {
            auto const input_area = buffer.data();
            return {reinterpret_cast<char const *>(input_area.data()), std::min(n, input_area.size())};
        }
    }

    stream_monitor_t::stream_monitor_t(boost::asio::io_context & io_context,
                                       std::string process_name,
                                       stream_kind_t stream,
                                       lib::AutoClosingFd fd,
                                       disconnection_signal_t & disconnection_signal,
                                       classifier_rules_t rules,
                                       line_observer_t observer)
        : strand(io_context),
          stream_descriptor(io_context, fd.release()),
          name(std::move(process_name)),
          stream(stream),
          disconnection_signal(disconnection_signal),
          rules(std::move(rules)),
          observer(std::move(observer))
    {
    }

    void stream_monitor_t::start()
    {
        boost::asio::post(strand, [st = shared_from_this()]() { st->do_read(); });
    }

    void stream_monitor_t::cancel()
    {
        boost::asio::post(strand, [st = shared_from_this()]() {
            if (st->stream_descriptor.is_open()) {
                boost::system::error_code ec {};
                st->stream_descriptor.close(ec);
                if (ec) {
                    LOG_DEBUG("%s (%s): close failed with %s",
                              st->name.c_str(),
                              to_string(st->stream),
                              ec.message().c_str());
                }
            }
        });
    }

    void stream_monitor_t::do_read()
    {
        if (!stream_descriptor.is_open()) {
            finish();
            return;
        }

        boost::asio::async_read_until(
            stream_descriptor,
            buffer,
            '\n',
            boost::asio::bind_executor(strand,
                                       [st = shared_from_this()](boost::system::error_code const & ec, std::size_t n) {
                                           st->on_read(ec, n);
                                       }));
    }

    void stream_monitor_t::on_read(boost::system::error_code const & ec, std::size_t n)
    {
        if (!ec) {
            auto const line = buffer_contents(buffer, n);
            auto const keep_going = on_line(line);
            buffer.consume(n);
            if (keep_going) {
                do_read();
            }
            else {
                finish();
            }
            return;
        }

        // the line is longer than the buffer allows; deliver what we have as one line
        if (ec == boost::asio::error::not_found) {
            auto const size = buffer.size();
            auto const keep_going = on_line(buffer_contents(buffer, size));
            buffer.consume(size);
            if (keep_going) {
                do_read();
            }
            else {
                finish();
            }
            return;
        }

        if (ec == boost::asio::error::eof) {
            // deliver any unterminated trailing text
            if (buffer.size() > 0) {
                auto const size = buffer.size();
                (void) on_line(buffer_contents(buffer, size));
                buffer.consume(size);
            }
            LOG_DEBUG("%s (%s): end of stream", name.c_str(), to_string(stream));
        }
        else if (ec == boost::asio::error::operation_aborted) {
            LOG_DEBUG("%s (%s): monitor cancelled", name.c_str(), to_string(stream));
        }
        else {
            LOG_ERROR("%s (%s): read failed: %s", name.c_str(), to_string(stream), ec.message().c_str());
        }

        finish();
    }

    bool stream_monitor_t::on_line(std::string_view raw_line)
    {
        auto const text = trim_line(raw_line);
        if (text.empty()) {
            return true;
        }

        auto const category = classify_line(text, rules);

        if (observer) {
            observer(classified_line_t {name, stream, category, std::string(text)});
        }

        switch (category) {
            case line_category_t::disconnect: {
                if (text.find(rules.unreachable_marker) != std::string_view::npos) {
                    LOG_ERROR("%s (%s): No ADB device found!", name.c_str(), to_string(stream));
                }
                else {
                    LOG_ERROR("%s (%s): Device disconnected detected!", name.c_str(), to_string(stream));
                }
                if (!disconnection_signal.set()) {
                    LOG_DEBUG("%s (%s): disconnection already signalled", name.c_str(), to_string(stream));
                }
                return false;
            }
            case line_category_t::fatal_error:
                LOG_ERROR("%s (%s): %.*s", name.c_str(), to_string(stream), int(text.size()), text.data());
                return true;
            case line_category_t::warning:
                LOG_WARNING("%s (%s): %.*s", name.c_str(), to_string(stream), int(text.size()), text.data());
                return true;
            case line_category_t::info:
                LOG_DEBUG("%s (%s): %.*s", name.c_str(), to_string(stream), int(text.size()), text.data());
                return true;
        }

        return true;
    }

    void stream_monitor_t::finish()
    {
        if (stream_descriptor.is_open()) {
            boost::system::error_code ec {};
            stream_descriptor.close(ec);
            if (ec) {
                LOG_DEBUG("%s (%s): close failed with %s", name.c_str(), to_string(stream), ec.message().c_str());
            }
        }
        complete.store(true, std::memory_order_release);
    }
}
