#include "core/Config.hpp"
#include "core/Errors.hpp"

#include <getopt.h>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <sstream>
#include <vector>

namespace core {

namespace {

enum LongOnlyOption {
    optInFlight = 1000,
    optMjpegPort,
    optNoDisplay,
    optBlend,
    optLogLevel
};

const struct option LONG_OPTIONS[] = {
    {"input",      required_argument, nullptr, 'i'},
    {"webcam",     required_argument, nullptr, 'w'},
    {"offset",     required_argument, nullptr, 'x'},
    {"radius",     required_argument, nullptr, 'r'},
    {"thickness",  required_argument, nullptr, 't'},
    {"model",      required_argument, nullptr, 'm'},
    {"workers",    required_argument, nullptr, 'j'},
    {"output",     required_argument, nullptr, 'o'},
    {"in-flight",  required_argument, nullptr, optInFlight},
    {"mjpeg-port", required_argument, nullptr, optMjpegPort},
    {"no-display", no_argument,       nullptr, optNoDisplay},
    {"blend",      required_argument, nullptr, optBlend},
    {"log-level",  required_argument, nullptr, optLogLevel},
    {"help",       no_argument,       nullptr, 'h'},
    {nullptr,      0,                 nullptr, 0}
};

int parseInt(const char* name, const char* text) {
    if (!text || *text == '\0') {
        throw InvalidConfiguration(std::string("--") + name + " needs an integer value");
    }
    errno = 0;
    char* end = nullptr;
    long value = std::strtol(text, &end, 10);
    if (errno != 0 || *end != '\0' || value < INT_MIN || value > INT_MAX) {
        throw InvalidConfiguration(std::string("--") + name + ": '" + text + "' is not an integer");
    }
    return static_cast<int>(value);
}

} // namespace

AppConfig parseCommandLine(int argc, char** argv) {
    AppConfig config;
    bool haveInput = false;
    bool haveWebcam = false;

    // Reset getopt state so the parser can run more than once per process
    optind = 0;
    opterr = 0;

    while (true) {
        int optionIndex = 0;
        int c = getopt_long(argc, argv, ":i:w:x:r:t:m:j:o:h", LONG_OPTIONS, &optionIndex);
        if (c == -1) break;

        switch (c) {
            case 'i':
                haveInput = true;
                config.source = std::string(optarg);
                break;
            case 'w':
                haveWebcam = true;
                config.source = parseInt("webcam", optarg);
                break;
            case 'x':
                config.compositor.offsetX = parseInt("offset", optarg);
                break;
            case 'r': {
                int radius = parseInt("radius", optarg);
                config.compositor.originalStyle.pointRadius = radius;
                config.compositor.mirroredStyle.pointRadius = radius;
                break;
            }
            case 't': {
                int thickness = parseInt("thickness", optarg);
                config.compositor.originalStyle.lineThickness = thickness;
                config.compositor.mirroredStyle.lineThickness = thickness;
                break;
            }
            case 'm':
                config.modelPath = optarg;
                break;
            case 'j':
                config.driver.workers = parseInt("workers", optarg);
                break;
            case 'o':
                config.outputPath = optarg;
                break;
            case optInFlight:
                config.driver.maxInFlight = parseInt("in-flight", optarg);
                break;
            case optMjpegPort:
                config.mjpegPort = parseInt("mjpeg-port", optarg);
                break;
            case optNoDisplay:
                config.display = false;
                break;
            case optBlend: {
                std::string mode = optarg;
                if (mode == "add") {
                    config.compositor.mirroredBlend = BlendMode::Additive;
                } else if (mode == "overwrite") {
                    config.compositor.mirroredBlend = BlendMode::Overwrite;
                } else {
                    throw InvalidConfiguration("--blend must be 'add' or 'overwrite', got '" + mode + "'");
                }
                break;
            }
            case optLogLevel: {
                auto level = Logger::parseLevel(optarg);
                if (!level) {
                    throw InvalidConfiguration(std::string("Unknown log level '") + optarg + "'");
                }
                config.logLevel = *level;
                break;
            }
            case 'h':
                config.showHelp = true;
                break;
            case ':':
                throw InvalidConfiguration(std::string("Option ") + argv[optind - 1] + " needs a value");
            default:
                throw InvalidConfiguration(std::string("Unknown option ") + argv[optind - 1]);
        }
    }

    if (optind < argc) {
        throw InvalidConfiguration(std::string("Unexpected argument '") + argv[optind] + "'");
    }

    if (haveInput && haveWebcam) {
        throw InvalidConfiguration("--input and --webcam are mutually exclusive");
    }

    return config;
}

void AppConfig::validate() const {
    if (!source) {
        throw InvalidConfiguration("A video source is required (--input PATH or --webcam N)");
    }
    if (std::holds_alternative<int>(*source) && std::get<int>(*source) < 0) {
        throw InvalidConfiguration("Webcam index must be >= 0");
    }
    if (std::holds_alternative<std::string>(*source) && std::get<std::string>(*source).empty()) {
        throw InvalidConfiguration("Input path is empty");
    }

    compositor.validate();
    driver.validate();

    if (modelPath.empty()) {
        throw InvalidConfiguration("Model path is empty");
    }
    if (mjpegPort < 0 || mjpegPort > 65535) {
        throw InvalidConfiguration("MJPEG port must be in [0, 65535], got " + std::to_string(mjpegPort));
    }
    if (!display && outputPath.empty() && mjpegPort == 0) {
        throw InvalidConfiguration("--no-display needs --output or --mjpeg-port, otherwise nothing is shown");
    }
}

std::string usage(const std::string& programName) {
    std::ostringstream oss;
    oss << "Usage: " << programName << " (--input PATH | --webcam N) [options]\n"
        << "\n"
        << "Overlays a horizontally mirrored copy of the detected skeleton next to the dancer.\n"
        << "\n"
        << "  -i, --input PATH       Video file to process\n"
        << "  -w, --webcam N         Camera device index\n"
        << "  -x, --offset N         Horizontal offset of the mirrored pose in pixels (default: "
        << DEFAULT_OFFSET_X << ")\n"
        << "  -r, --radius N         Radius of landmark circles (default: " << DEFAULT_POINT_RADIUS << ")\n"
        << "  -t, --thickness N      Thickness of connection lines (default: " << DEFAULT_LINE_THICKNESS << ")\n"
        << "  -m, --model PATH       Pose landmark model, .onnx or .engine\n"
        << "                         (default: models/pose_landmark_full.onnx)\n"
        << "  -j, --workers N        Compositor threads (default: 1)\n"
        << "      --in-flight N      Max frames in flight with several workers (default: 2 x workers)\n"
        << "  -o, --output PATH      Also write the composite video to PATH\n"
        << "      --mjpeg-port N     Serve the composite as MJPEG over HTTP on port N\n"
        << "      --no-display       Do not open a window\n"
        << "      --blend MODE       Mirrored skeleton blending: add (default) or overwrite\n"
        << "      --log-level LEVEL  debug, info, warn or error (default: info)\n"
        << "  -h, --help             Show this help\n"
        << "\n"
        << "Press 'q' or ESC in the window (or Ctrl+C) to stop.\n";
    return oss.str();
}

} // namespace core
