#include "net/LineAssembler.hpp"

namespace jh::client::net {

std::optional<QByteArray> LineAssembler::clean(QByteArray line) {
    if (line.endsWith('\r')) {
        line.chop(1);
    }
    if (line.trimmed().isEmpty()) {
        return std::nullopt;
    }
    return line;
}

std::vector<QByteArray> LineAssembler::feed(const QByteArray& chunk) {
    buffer_.append(chunk);

    std::vector<QByteArray> lines;
    while (true) {
        const auto newlineIndex = buffer_.indexOf('\n');
        if (newlineIndex < 0) {
            break;
        }

        auto line = clean(buffer_.left(newlineIndex));
        buffer_.remove(0, newlineIndex + 1);

        if (line) {
            lines.push_back(std::move(*line));
        }
    }
    return lines;
}

std::optional<QByteArray> LineAssembler::flush() {
    QByteArray rest;
    rest.swap(buffer_);
    return clean(std::move(rest));
}

} // namespace jh::client::net
