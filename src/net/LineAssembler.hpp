#pragma once

#include <QByteArray>

#include <optional>
#include <vector>

namespace jh::client::net {

// Splits a byte stream into '\n'-terminated lines in arrival order.
// CR is stripped and blank lines are dropped.
class LineAssembler {
public:
    std::vector<QByteArray> feed(const QByteArray& chunk);

    // Trailing partial line, if any. Used when the stream ends.
    std::optional<QByteArray> flush();

    void reset() { buffer_.clear(); }

private:
    static std::optional<QByteArray> clean(QByteArray line);

    QByteArray buffer_;
};

} // namespace jh::client::net
