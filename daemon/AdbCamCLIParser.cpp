/* Copyright (C) 2014-2025 by Arm Limited. All rights reserved. */

#include "AdbCamCLIParser.h"

#include "host/capture_commands.h"

#include <array>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <string>
#include <string_view>
#include <utility>

#include <boost/regex.hpp>

#include <getopt.h>

namespace {
    constexpr const char * OPTSTRING_SHORT = "c:s:f:m:V:L:N:p:t:P:g:w:ldhv";

    // NOLINTNEXTLINE(modernize-avoid-c-arrays)
    const struct option OPTSTRING_LONG[] = {
        {"camera-id", /**************/ required_argument, nullptr, 'c'}, //
        {"camera-size", /************/ required_argument, nullptr, 's'}, //
        {"camera-fps", /*************/ required_argument, nullptr, 'f'}, //
        {"mic-source", /*************/ required_argument, nullptr, 'm'}, //
        {"video-device", /***********/ required_argument, nullptr, 'V'}, //
        {"card-label", /*************/ required_argument, nullptr, 'L'}, //
        {"source-name", /************/ required_argument, nullptr, 'N'}, //
        {"pipe-path", /**************/ required_argument, nullptr, 'p'}, //
        {"capture-tool", /***********/ required_argument, nullptr, 't'}, //
        {"poll-interval", /**********/ required_argument, nullptr, 'P'}, //
        {"grace-period", /***********/ required_argument, nullptr, 'g'}, //
        {"settle-delay", /***********/ required_argument, nullptr, 'w'}, //
        {"list-cameras", /***********/ no_argument, /***/ nullptr, 'l'}, //
        {"debug", /******************/ no_argument, /***/ nullptr, 'd'}, //
        {"help", /*******************/ no_argument, /***/ nullptr, 'h'}, //
        {"version", /****************/ no_argument, /***/ nullptr, 'v'}, //
        {nullptr, 0, nullptr, 0}};

    const boost::regex resolution_regex {R"(\d+x\d+)"};

    bool stringToInt(int * value, const char * str)
    {
        if ((str == nullptr) || (*str == '\0')) {
            return false;
        }

        char * endptr = nullptr;
        errno = 0;
        long const result = std::strtol(str, &endptr, 10);
        if ((errno != 0) || (*endptr != '\0') || (result < INT_MIN) || (result > INT_MAX)) {
            return false;
        }

        *value = int(result);
        return true;
    }

    bool parseMilliseconds(std::chrono::milliseconds & value, const char * str, bool allow_zero)
    {
        int ms = 0;
        if ((!stringToInt(&ms, str)) || (ms < 0) || ((ms == 0) && !allow_zero)) {
            return false;
        }
        value = std::chrono::milliseconds {ms};
        return true;
    }
}

void AdbCamCLIParser::parseCLIArguments(int argc,
                                        char * argv[]) // NOLINT(modernize-avoid-c-arrays)
{
    optind = 0; // also resets getopt's position within a previously scanned argument
    opterr = 0; // Tell getopt_long not to report errors
    int c;
    while ((c = getopt_long(argc, argv, OPTSTRING_SHORT, OPTSTRING_LONG, nullptr)) != -1) {
        switch (c) {
            case 'c': {
                int id = 0;
                if ((!stringToInt(&id, optarg)) || (id < 0)) {
                    result.error_messages.emplace_back(std::string("Invalid camera id (") + optarg + ").");
                    result.parsingFailed();
                    return;
                }
                result.camera_id = std::string(optarg);
                break;
            }
            case 's':
                if (!boost::regex_match(optarg, resolution_regex)) {
                    result.error_messages.emplace_back(std::string("Invalid camera size (") + optarg
                                                       + "), WIDTHxHEIGHT expected.");
                    result.parsingFailed();
                    return;
                }
                result.camera_size = std::string(optarg);
                break;
            case 'f': {
                int fps = 0;
                if ((!stringToInt(&fps, optarg)) || (fps <= 0)) {
                    result.error_messages.emplace_back(std::string("Invalid camera fps (") + optarg + ").");
                    result.parsingFailed();
                    return;
                }
                result.camera_fps = fps;
                break;
            }
            case 'm': {
                auto source = adbcam::host::resolve_mic_source(optarg);
                if (!source) {
                    result.error_messages.emplace_back(std::string("Invalid microphone source (") + optarg
                                                       + "). Use --help to list the sources.");
                    result.parsingFailed();
                    return;
                }
                result.mic_source = std::move(*source);
                break;
            }
            case 'V':
                result.video_device = optarg;
                break;
            case 'L':
                result.card_label = optarg;
                break;
            case 'N':
                result.source_name = optarg;
                break;
            case 'p':
                result.pipe_path = optarg;
                break;
            case 't':
                result.capture_tool = optarg;
                break;
            case 'P':
                if (!parseMilliseconds(result.poll_interval, optarg, false)) {
                    result.error_messages.emplace_back(std::string("Invalid poll interval (") + optarg
                                                       + "), a positive number of milliseconds expected.");
                    result.parsingFailed();
                    return;
                }
                break;
            case 'g':
                if (!parseMilliseconds(result.grace_period, optarg, true)) {
                    result.error_messages.emplace_back(std::string("Invalid grace period (") + optarg
                                                       + "), a number of milliseconds expected.");
                    result.parsingFailed();
                    return;
                }
                break;
            case 'w':
                if (!parseMilliseconds(result.settle_delay, optarg, true)) {
                    result.error_messages.emplace_back(std::string("Invalid settle delay (") + optarg
                                                       + "), a number of milliseconds expected.");
                    result.parsingFailed();
                    return;
                }
                break;
            case 'l':
                result.mode = ParserResult::ExecutionMode::LIST_CAMERAS;
                break;
            case 'd':
                result.debug = true;
                break;
            case 'h':
                result.mode = ParserResult::ExecutionMode::USAGE;
                return;
            case 'v':
                result.mode = ParserResult::ExecutionMode::VERSION;
                return;
            case '?':
            default: {
                std::string const opt_string =
                    ((optopt != 0) ? (std::string("-") + char(optopt)) : std::string(argv[optind - 1]));
                result.error_messages.emplace_back("Unrecognized or incomplete option " + opt_string
                                                   + "\nSee --help for more information.");
                result.parsingFailed();
                return;
            }
        }
    }

    // Error checking
    if (optind < argc) {
        result.error_messages.emplace_back(std::string("Unknown argument:") + argv[optind]
                                           + ". Use --help to list valid arguments.");
        result.parsingFailed();
        return;
    }
}

using namespace std::literals::string_view_literals;

//NOLINTNEXTLINE(modernize-avoid-c-arrays)
bool AdbCamCLIParser::hasDebugFlag(int argc, const char * const argv[])
{
    constexpr std::array<std::string_view, 2> args {{"-d"sv, "--debug"sv}};

    for (int i = 1; i < argc; ++i) {
        for (auto const & arg : args) {
            if (arg == argv[i]) {
                return true;
            }
        }
    }
    return false;
}

/* ------------------------------------ last character before new line here ----+ */
/*                                                                              | */
/*                                                                              v */
const char * const AdbCamCLIParser::USAGE_MESSAGE = R"(
adbcamd turns the cameras and microphone of an Android device into a virtual
webcam (v4l2loopback) and a virtual microphone (PulseAudio pipe source), and
supervises the capture processes until the device disconnects or Ctrl+C.

* Capture selection:
  -c|--camera-id <id>                   Camera to capture (default: 0)
  -s|--camera-size <WxH>                Resolution (default: 1920x1080 when
                                        supported, else the first listed)
  -f|--camera-fps <fps>                 Frame rate (default: the highest
                                        supported)
  -m|--mic-source <name|1-5>            Microphone source (default:
                                        mic-camcorder). One of
                                        1: mic
                                        2: mic-unprocessed
                                        3: mic-camcorder
                                        4: mic-voice-recognition
                                        5: mic-voice-communication
  -l|--list-cameras                     Print the device's cameras and exit

* Host devices:
  -V|--video-device <path>              Loopback device (default: /dev/video0)
  -L|--card-label <text>                Loopback card label (default: AdbCam)
  -N|--source-name <text>               Virtual microphone name (default:
                                        AdbCam)
  -p|--pipe-path <path>                 Audio pipe (default: /tmp/adbcam_pipe)
  -t|--capture-tool <path>              Capture tool (default: scrcpy)

* Supervision:
  -P|--poll-interval <ms>               Liveness poll interval (default: 300)
  -g|--grace-period <ms>                Time allowed to exit after SIGTERM
                                        (default: 2000)
  -w|--settle-delay <ms>                Delay between starting video and audio
                                        (default: 2000)

* Other:
  -d|--debug                            Enable debug messages
  -h|--help                             This help page
  -v|--version                          Print version information
)";
