/* Copyright (C) 2021-2025 by Arm Limited (or its affiliates). All rights reserved. */

#include "host/command_runner.h"

#include "Logging.h"

#include <future>
#include <string>
#include <system_error>

#include <boost/asio/io_context.hpp>
#include <boost/filesystem/path.hpp>
#include <boost/version.hpp>

#if BOOST_VERSION >= (108600)
#include <boost/process/v1/args.hpp>
#include <boost/process/v1/async.hpp>
#include <boost/process/v1/child.hpp>
#include <boost/process/v1/error.hpp>
#include <boost/process/v1/exe.hpp>
#include <boost/process/v1/io.hpp>
#include <boost/process/v1/search_path.hpp>
namespace boost_process = boost::process::v1;
#else
#include <boost/process/args.hpp>
#include <boost/process/async.hpp>
#include <boost/process/child.hpp>
#include <boost/process/error.hpp>
#include <boost/process/exe.hpp>
#include <boost/process/io.hpp>
#include <boost/process/search_path.hpp>
namespace boost_process = boost::process;
#endif

namespace adbcam::host {
    namespace {
        boost::filesystem::path resolve_executable(std::string const & program)
        {
            if (program.find('/') != std::string::npos) {
                return boost::filesystem::path {program};
            }
            return boost_process::search_path(program);
        }
    }

    lib::error_code_or_t<command_output_t> run_command(std::vector<std::string> const & command_and_args,
                                                       std::chrono::milliseconds timeout)
    {
        if (command_and_args.empty()) {
            return boost::system::errc::make_error_code(boost::system::errc::invalid_argument);
        }

        auto const exe = resolve_executable(command_and_args.front());
        if (exe.empty()) {
            LOG_DEBUG("'%s' was not found on PATH", command_and_args.front().c_str());
            return boost::system::errc::make_error_code(boost::system::errc::no_such_file_or_directory);
        }

        std::vector<std::string> const args(command_and_args.begin() + 1, command_and_args.end());

        boost::asio::io_context ios {};
        std::future<std::string> out {};
        std::future<std::string> err {};
        std::error_code spawn_ec {};

        boost_process::child child {boost_process::exe = exe,
                                    boost_process::args = args,
                                    boost_process::std_in.close(),
                                    boost_process::std_out > out,
                                    boost_process::std_err > err,
                                    boost_process::error(spawn_ec),
                                    ios};

        if (spawn_ec) {
            LOG_DEBUG("Failed to start '%s': %s", command_and_args.front().c_str(), spawn_ec.message().c_str());
            return boost::system::error_code {spawn_ec.value(), boost::system::system_category()};
        }

        // drives the output pipes and the exit notification
        ios.run_for(timeout);

        if (!ios.stopped()) {
            LOG_WARNING("'%s' did not complete within %lld ms",
                        command_and_args.front().c_str(),
                        static_cast<long long>(timeout.count()));
            std::error_code terminate_ec {};
            child.terminate(terminate_ec);
            if (terminate_ec) {
                LOG_DEBUG("Failed to kill '%s': %s", command_and_args.front().c_str(), terminate_ec.message().c_str());
            }
            return boost::system::errc::make_error_code(boost::system::errc::timed_out);
        }

        std::error_code wait_ec {};
        child.wait(wait_ec);
        if (wait_ec) {
            return boost::system::error_code {wait_ec.value(), boost::system::system_category()};
        }

        return command_output_t {child.exit_code(), out.get(), err.get()};
    }
}
