#include <sstream>
#include <string_view>

#include <gtest/gtest.h>

#include "nowiki/util/severity.hpp"

#include "nowiki/diagnostic.hpp"
#include "nowiki/services.hpp"
#include "nowiki/stream_logger.hpp"

namespace nowiki {
namespace {

TEST(Stream_Logger, format)
{
    std::ostringstream out;
    Stream_Logger logger { out, Severity::min };
    logger.log({ Severity::warning, diagnostic::format_unknown, u8"Unknown format." });

    EXPECT_EQ(out.str(), "WARNING: Unknown format. [nowiki.format.unknown]\n");
    EXPECT_FALSE(logger.any_errors());
}

TEST(Stream_Logger, min_severity)
{
    std::ostringstream out;
    Stream_Logger logger { out, Severity::warning };
    logger.log({ Severity::debug, diagnostic::expand, u8"Expanding." });
    EXPECT_EQ(out.str(), "");

    logger.log({ Severity::error, diagnostic::malformed, u8"Malformed." });
    EXPECT_EQ(out.str(), "ERROR: Malformed. [nowiki.malformed]\n");
    EXPECT_TRUE(logger.any_errors());
}

TEST(Stream_Logger, ignorant_logger_logs_nothing)
{
    EXPECT_FALSE(ignorant_logger.can_log(Severity::fatal));
}

} // namespace
} // namespace nowiki
