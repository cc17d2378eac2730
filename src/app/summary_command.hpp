#pragma once

#include <QString>

#include <cstddef>

#include "app/cli_options.hpp"
#include "core/result.hpp"

class QTextStream;

namespace booksum::app {

struct SummaryOutcome {
    enum class Status {
        Written,
        Declined
    };

    Status status{Status::Written};
    QString outputPath;
    std::size_t noteCount{0};
    std::size_t rejectedCount{0};
};

// The whole run: book config -> scan -> build -> render -> confirm -> write.
// `in`/`out` carry the overwrite prompt and the final status line.
[[nodiscard]] Result<SummaryOutcome> run_summary(CliOptions options, QTextStream& in, QTextStream& out);

} // namespace booksum::app
