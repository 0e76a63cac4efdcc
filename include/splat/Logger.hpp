#ifndef INKSPLATTER_LOGGER_HPP
#define INKSPLATTER_LOGGER_HPP
#include <filesystem>
#include <memory>
#include <source_location>
#include <spdlog/logger.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace splat
{

/**
 * @brief Process wide logger for the splatter engine and its hosts
 *
 * Writes to a colored console sink and to SPLAT_LOG_FILE. Every call to instance()
 * re-targets the pattern so that each line carries the calling file and line.
 */
class Logger : public spdlog::logger
{
	std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> m_console_sink;
	std::shared_ptr<spdlog::sinks::basic_file_sink_mt>	 m_file_sink;

	Logger()
		: logger("InkSplatter")
		, m_console_sink(std::make_shared<spdlog::sinks::stdout_color_sink_mt>())
		, m_file_sink(std::make_shared<spdlog::sinks::basic_file_sink_mt>(SPLAT_LOG_FILE, true))
	{
#ifndef NDEBUG
		m_console_sink->set_level(spdlog::level::trace);
#else
		m_console_sink->set_level(spdlog::level::warn);
#endif
		m_file_sink->set_level(spdlog::level::trace);
		sinks().push_back(m_console_sink);
		sinks().push_back(m_file_sink);
		set_level(spdlog::level::trace);
	}

public:
	static Logger& instance(std::source_location loc = std::source_location::current())
	{
		static Logger logger;
		std::filesystem::path path = loc.file_name();
		auto location = fmt::format("[{}:{}]", std::string{path.filename()}, loc.line());
		logger.set_pattern(fmt::format("[InkSplatter]{:<32}[%^%5l%$] %v", location));
		return logger;
	}

	/// Only affects the console; the log file keeps everything.
	void set_console_level(spdlog::level::level_enum level) { m_console_sink->set_level(level); }
};

} // namespace splat

#endif // INKSPLATTER_LOGGER_HPP
