/* Copyright (C) 2025 by Arm Limited. All rights reserved. */

#include "supervisor/cleanup_coordinator.h"

#include "Logging.h"

#include <exception>
#include <utility>

namespace adbcam::supervisor {
    namespace {
        template<typename Step>
        void run_step(const char * description, Step && step)
        {
            try {
                auto const ec = step();
                if (ec) {
                    LOG_WARNING("Cleanup: %s failed: %s", description, ec.message().c_str());
                }
            }
            catch (std::exception const & ex) {
                LOG_WARNING("Cleanup: %s failed: %s", description, ex.what());
            }
        }
    }

    cleanup_coordinator_t::cleanup_coordinator_t(process_supervisor_t & supervisor,
                                                 i_host_resources_t & host_resources,
                                                 std::string capture_tool_signature,
                                                 std::chrono::milliseconds grace_period)
        : supervisor(supervisor),
          host_resources(host_resources),
          capture_tool_signature(std::move(capture_tool_signature)),
          grace_period(grace_period)
    {
    }

    void cleanup_coordinator_t::set_audio_module(std::string module_id)
    {
        std::lock_guard<std::mutex> lock {mutex};
        resource_handles.audio_module_id = std::move(module_id);
    }

    void cleanup_coordinator_t::set_pipe_path(std::string path)
    {
        std::lock_guard<std::mutex> lock {mutex};
        resource_handles.pipe_path = std::move(path);
    }

    external_resource_handles_t cleanup_coordinator_t::handles() const
    {
        std::lock_guard<std::mutex> lock {mutex};
        return resource_handles;
    }

    termination_report_t cleanup_coordinator_t::last_termination_report() const
    {
        std::lock_guard<std::mutex> lock {mutex};
        return termination_report;
    }

    bool cleanup_coordinator_t::cleanup()
    {
        if (started.exchange(true, std::memory_order_acq_rel)) {
            LOG_DEBUG("Cleanup already performed");
            return false;
        }

        LOG_INFO("Cleaning up...");

        auto const current = handles();

        if (current.audio_module_id) {
            run_step("unloading audio module", [&]() {
                LOG_DEBUG("Unloading audio module %s", current.audio_module_id->c_str());
                return host_resources.release_audio_module(*current.audio_module_id);
            });
        }

        if (current.pipe_path) {
            run_step("removing named pipe", [&]() {
                LOG_DEBUG("Removing pipe %s", current.pipe_path->c_str());
                return host_resources.remove_pipe(*current.pipe_path);
            });
        }

        if (!capture_tool_signature.empty()) {
            run_step("terminating capture tool processes",
                     [&]() { return host_resources.terminate_capture_tool_processes(capture_tool_signature); });
        }

        run_step("terminating supervised processes", [&]() {
            auto const report = supervisor.terminate_all(grace_period);
            LOG_DEBUG("Terminated processes: %zu graceful, %zu forced", report.n_graceful, report.n_forced);
            {
                std::lock_guard<std::mutex> lock {mutex};
                termination_report = report;
            }
            return boost::system::error_code {};
        });

        LOG_INFO("Cleanup complete.");

        return true;
    }
}
