#include "expo/qr_generator.hpp"
#include "platform/platform_abi.hpp"
#include "utils/debug_log.hpp"

#include <libwebsockets.h>

#include <vector>

namespace qr_generator {

static constexpr int kQrencodeTimeoutMilliseconds = 5000;

std::optional<QrFormat> parse_format(const std::string &name) {
    if (name == "terminal") return QrFormat::Terminal;
    if (name == "svg") return QrFormat::Svg;
    if (name == "png") return QrFormat::Png;
    if (name == "url") return QrFormat::Url;
    return std::nullopt;
}

std::string format_to_string(QrFormat format) {
    switch (format) {
    case QrFormat::Terminal:
        return "terminal";
    case QrFormat::Svg:
        return "svg";
    case QrFormat::Png:
        return "png";
    case QrFormat::Url:
        return "url";
    }
    return "url";
}

std::string encode_base64(const std::string &bytes) {
    // 4 output bytes per 3 input bytes, plus padding and terminator.
    std::vector<char> output(((bytes.size() + 2) / 3) * 4 + 1);
    int written = lws_b64_encode_string(bytes.data(), static_cast<int>(bytes.size()), output.data(),
                                        static_cast<int>(output.size()));
    if (written < 0) {
        return "";
    }
    return std::string(output.data(), static_cast<size_t>(written));
}

QrResult generate(const std::string &url, QrFormat format, const std::string &qrencode_executable) {
    QrResult result;
    result.format = format;
    result.url = url;

    if (format == QrFormat::Url) {
        result.success = true;
        result.data = url;
        return result;
    }

    std::vector<std::string> argv = {qrencode_executable, "-m", "1"};
    switch (format) {
    case QrFormat::Terminal:
        argv.insert(argv.end(), {"-t", "UTF8"});
        break;
    case QrFormat::Svg:
        argv.insert(argv.end(), {"-t", "SVG"});
        break;
    case QrFormat::Png:
        argv.insert(argv.end(), {"-t", "PNG", "-s", "6"});
        break;
    case QrFormat::Url:
        break;
    }
    argv.insert(argv.end(), {"-o", "-", url});

    debug_log::log("Generating " + format_to_string(format) + " QR code for " + url);
    platform::RunResult run_result = platform::run_process(argv, kQrencodeTimeoutMilliseconds);
    if (!run_result.success) {
        result.error_message = "Failed to generate " + format_to_string(format) + " QR code";
        if (!run_result.error_message.empty()) {
            result.error_message += ": " + run_result.error_message;
        } else if (!run_result.standard_error.empty()) {
            result.error_message += ": " + run_result.standard_error;
        }
        return result;
    }
    if (run_result.standard_output.empty()) {
        result.error_message = "Failed to generate " + format_to_string(format) + " QR code: empty output";
        return result;
    }

    if (format == QrFormat::Png) {
        std::string encoded = encode_base64(run_result.standard_output);
        if (encoded.empty()) {
            result.error_message = "Failed to encode PNG QR code";
            return result;
        }
        result.data = "data:image/png;base64," + encoded;
    } else {
        result.data = run_result.standard_output;
    }
    result.success = true;
    return result;
}

std::string format_output(const QrResult &result) {
    std::string output;
    switch (result.format) {
    case QrFormat::Terminal:
        output += "\n=== Expo Dev Server QR Code ===\n\n";
        output += result.data;
        output += "\n\nURL: " + result.url + "\n";
        output += "Scan with Expo Go app to open on your device\n";
        break;
    case QrFormat::Svg:
        output += "=== SVG QR Code ===\n\n";
        output += result.data;
        output += "\n\nURL: " + result.url + "\n";
        break;
    case QrFormat::Png:
        output += "=== PNG QR Code (Base64 Data URI) ===\n\n";
        output += "![QR Code](" + result.data + ")\n\n";
        output += "URL: " + result.url + "\n";
        output += "Copy the data URI to display in browser or embed in HTML\n";
        break;
    case QrFormat::Url:
        output += "=== Expo Dev Server URL ===\n\n";
        output += result.url + "\n";
        break;
    }
    return output;
}

} // namespace qr_generator
