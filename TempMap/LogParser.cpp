// Copyright © 2025 Cadell Richard Anderson

// =================================================================
// LogParser.cpp
// =================================================================
#include "LogParser.h"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>

namespace tempmap {

    namespace {

        static bool is_digit(char c) {
            return c >= '0' && c <= '9';
        }

        static bool is_space(char c) {
            return std::isspace(static_cast<unsigned char>(c)) != 0;
        }

        // "#####123#####" -> "123"
        static std::optional<std::string_view> match_delimiter(std::string_view line) {
            constexpr std::string_view fence = "#####";
            if (line.size() <= 2 * fence.size()) return std::nullopt;
            if (!line.starts_with(fence) || !line.ends_with(fence)) return std::nullopt;
            const std::string_view digits = line.substr(fence.size(), line.size() - 2 * fence.size());
            if (!std::all_of(digits.begin(), digits.end(), is_digit)) return std::nullopt;
            return digits;
        }

        // Forward-only cursor over one trimmed log line.
        class LineScanner {
        public:
            explicit LineScanner(std::string_view line) : rest_(line) {}

            bool literal(std::string_view word) {
                if (!rest_.starts_with(word)) return false;
                rest_.remove_prefix(word.size());
                return true;
            }

            // Skips whitespace; fails only when at least one character was required.
            bool spaces(bool required) {
                size_t n = 0;
                while (n < rest_.size() && is_space(rest_[n])) ++n;
                rest_.remove_prefix(n);
                return !required || n > 0;
            }

            std::string_view digits() {
                return take(count_digits(0));
            }

            // [-+]? then "12", "12.", "12.5" or ".5"
            std::string_view decimal() {
                size_t n = 0;
                if (n < rest_.size() && (rest_[n] == '-' || rest_[n] == '+')) ++n;
                const size_t whole = count_digits(n);
                n += whole;
                if (n < rest_.size() && rest_[n] == '.') {
                    const size_t frac = count_digits(n + 1);
                    if (whole == 0 && frac == 0) return {};
                    n += 1 + frac;
                }
                else if (whole == 0) {
                    return {};
                }
                return take(n);
            }

        private:
            size_t count_digits(size_t from) const {
                size_t n = from;
                while (n < rest_.size() && is_digit(rest_[n])) ++n;
                return n - from;
            }

            std::string_view take(size_t n) {
                const std::string_view out = rest_.substr(0, n);
                rest_.remove_prefix(n);
                return out;
            }

            std::string_view rest_;
        };

        struct ReadingTokens {
            std::string_view channel;
            std::string_view valid;
            std::string_view temperature;
        };

        // "chnl 12, valid 1, temp -3.25" (anything after the temperature is ignored)
        static std::optional<ReadingTokens> match_reading(std::string_view line) {
            LineScanner scan(line);
            ReadingTokens tokens;
            auto separator = [&scan] {
                scan.spaces(false);
                if (!scan.literal(",")) return false;
                scan.spaces(false);
                return true;
            };

            if (!scan.literal("chnl") || !scan.spaces(true)) return std::nullopt;
            tokens.channel = scan.digits();
            if (tokens.channel.empty() || !separator()) return std::nullopt;

            if (!scan.literal("valid") || !scan.spaces(true)) return std::nullopt;
            tokens.valid = scan.digits();
            if (tokens.valid.empty() || !separator()) return std::nullopt;

            if (!scan.literal("temp") || !scan.spaces(true)) return std::nullopt;
            tokens.temperature = scan.decimal();
            if (tokens.temperature.empty()) return std::nullopt;
            return tokens;
        }

        static std::string_view trim(std::string_view s) {
            constexpr std::string_view ws = " \t\r\n\f\v";
            const auto first = s.find_first_not_of(ws);
            if (first == std::string_view::npos) return s.substr(s.size());
            const auto last = s.find_last_not_of(ws);
            return s.substr(first, last - first + 1);
        }

        template <typename T>
        static bool parse_number(std::string_view s, T& out) {
            if (!s.empty() && s.front() == '+') s.remove_prefix(1);
            auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
            return ec == std::errc() && ptr == s.data() + s.size();
        }

        enum class ParserState {
            NoBlockOpen,
            BlockOpen
        };

        // Two-state machine driven by delimiter and reading events.
        class BlockAccumulator {
        public:
            explicit BlockAccumulator(ParseResult& out) : out_(out) {}

            void onDelimiter(std::string title) {
                if (state_ == ParserState::BlockOpen) close();
                current_ = Block{};
                current_.title = std::move(title);
                state_ = ParserState::BlockOpen;
            }

            void onReading(const Reading& reading, u64 valid) {
                if (valid != 1) {
                    ++out_.diagnostics.invalidReadings;
                    return;
                }
                if (state_ == ParserState::NoBlockOpen) {
                    // Readings before the first delimiter form an untitled block.
                    current_ = Block{};
                    state_ = ParserState::BlockOpen;
                }
                auto [it, inserted] = current_.readings.insert_or_assign(reading.channel, reading.temperature);
                if (!inserted) ++out_.diagnostics.overwrittenReadings;
                ++out_.diagnostics.acceptedReadings;
            }

            void finish() {
                if (state_ == ParserState::BlockOpen) close();
            }

        private:
            void close() {
                if (current_.empty()) {
                    ++out_.diagnostics.droppedEmptyBlocks;
                }
                else {
                    out_.blocks.push_back(std::move(current_));
                }
                current_ = Block{};
                state_ = ParserState::NoBlockOpen;
            }

            ParseResult& out_;
            ParserState state_ = ParserState::NoBlockOpen;
            Block current_;
        };
    }

    ParseResult LogParser::parse(std::string_view logText) {
        ParseResult result;
        BlockAccumulator acc(result);

        constexpr std::string_view bom = "\xEF\xBB\xBF";
        if (logText.substr(0, bom.size()) == bom) logText.remove_prefix(bom.size());

        size_t pos = 0;
        while (pos < logText.size()) {
            size_t eol = logText.find('\n', pos);
            if (eol == std::string_view::npos) eol = logText.size();
            const std::string_view line = trim(logText.substr(pos, eol - pos));
            pos = eol + 1;
            ++result.diagnostics.totalLines;

            if (auto title = match_delimiter(line)) {
                ++result.diagnostics.delimiterLines;
                acc.onDelimiter(std::string(*title));
                continue;
            }

            if (auto tokens = match_reading(line)) {
                Reading reading;
                u64 valid = 0;
                const bool channelOk = parse_number(tokens->channel, reading.channel);
                const bool validOk = parse_number(tokens->valid, valid);
                const bool tempOk = parse_number(tokens->temperature, reading.temperature);
                if (channelOk && tempOk) {
                    // An out-of-range validity flag is still "not 1".
                    acc.onReading(reading, validOk ? valid : 0);
                    continue;
                }
            }

            ++result.diagnostics.ignoredLines;
        }

        acc.finish();
        return result;
    }

    std::expected<std::string, PipelineFailure> LogParser::readFile(const std::filesystem::path& path) {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec)) {
            return std::unexpected(PipelineFailure{ TempMapError::MissingFile,
                "log file not found: " + path.string() });
        }

        std::ifstream in(path, std::ios::binary);
        if (!in) {
            return std::unexpected(PipelineFailure{ TempMapError::MissingFile,
                "cannot open log file: " + path.string() });
        }
        std::ostringstream ss;
        ss << in.rdbuf();
        if (in.bad()) {
            return std::unexpected(PipelineFailure{ TempMapError::IOError,
                "read error in log file: " + path.string() });
        }
        return ss.str();
    }

    std::expected<ParseResult, PipelineFailure> LogParser::parseFile(const std::filesystem::path& path) {
        auto text = readFile(path);
        if (!text) return std::unexpected(text.error());
        return parse(*text);
    }

} // namespace tempmap
