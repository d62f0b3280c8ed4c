#ifndef RNMCPS_QR_GENERATOR_HPP
#define RNMCPS_QR_GENERATOR_HPP

// QR codes for dev-server URLs. Rendering is delegated to the external
// qrencode tool; the url format needs no tool at all.

#include <optional>
#include <string>

namespace qr_generator {

enum class QrFormat {
    Terminal,
    Svg,
    Png,
    Url
};

std::optional<QrFormat> parse_format(const std::string &name);
std::string format_to_string(QrFormat format);

struct QrResult {
    bool success = false;
    QrFormat format = QrFormat::Url;
    std::string data;   // terminal art, SVG text, PNG data URI, or the URL
    std::string url;
    std::string error_message;
};

// qrencode_executable: name or path of the tool, as in ServerConfig.
QrResult generate(const std::string &url, QrFormat format, const std::string &qrencode_executable);

// Wrap a successful result in its display banner.
std::string format_output(const QrResult &result);

// Standard base64 of arbitrary bytes.
std::string encode_base64(const std::string &bytes);

} // namespace qr_generator

#endif // RNMCPS_QR_GENERATOR_HPP
