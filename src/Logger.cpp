#include "Logger.hpp"
#include "Utilities.hpp"

#include <string>
#include <ctime>
#include <chrono>
#include <stdexcept>

#include <unistd.h>

using namespace std;

namespace EyeTrack {

#define CONSOLE_COLOR_RESETALL				"\x1B[0m"
#define CONSOLE_COLOR_FOREGROUND_RED		"\x1B[91m"
#define CONSOLE_COLOR_FOREGROUND_YELLOW		"\x1B[93m"
#define CONSOLE_COLOR_FOREGROUND_BLUE		"\x1B[94m"
#define CONSOLE_COLOR_FOREGROUND_CYAN		"\x1B[96m"
#define CONSOLE_COLOR_FOREGROUND_LIGHTGRAY	"\x1B[37m"
#define CONSOLE_FONT_BOLD_ON				"\x1B[1m"
#define CONSOLE_FONT_DIM_ON					"\x1B[2m"
#define CONSOLE_FONT_REVERSE_ON				"\x1B[7m"

// The logger cannot log its own mutex failures, so it uses bare SDL calls.
#define Logger_Lock() do {											\
	if(SDL_LockMutex(staticMutex) != 0) {							\
		throw runtime_error("Logger failed to lock its mutex.");	\
	}																\
} while(0)

#define Logger_Unlock() do {										\
	if(SDL_UnlockMutex(staticMutex) != 0) {							\
		throw runtime_error("Logger failed to unlock its mutex.");	\
	}																\
} while(0)

LogMessageSeverity Logger::severityFilter = LOG_SEVERITY_FILTERDEFAULT;
bool Logger::outFileOpened = false;
FILE *Logger::outFile = stderr;
LogColorModes Logger::colorMode = LOG_COLORS_AUTO;
int Logger::colorsEligible = -1;
SDL_mutex *Logger::staticMutex = SDL_CreateMutex();

Logger::Logger(std::string myName) {
	name = myName;
	if(name.find('%') != string::npos) {
		throw invalid_argument("Logger name must not contain a percent sign.");
	}
}

#define LOGGER_FORWARD(SEVERITY) do {	\
	va_list args;						\
	va_start(args, fmt);				\
	svlog(name, SEVERITY, fmt, args);	\
	va_end(args);						\
} while(0)

void Logger::debug4(const char *fmt, ...) {
	LOGGER_FORWARD(LOG_SEVERITY_DEBUG4);
}

void Logger::debug3(const char *fmt, ...) {
	LOGGER_FORWARD(LOG_SEVERITY_DEBUG3);
}

void Logger::debug2(const char *fmt, ...) {
	LOGGER_FORWARD(LOG_SEVERITY_DEBUG2);
}

void Logger::debug1(const char *fmt, ...) {
	LOGGER_FORWARD(LOG_SEVERITY_DEBUG1);
}

void Logger::info(const char *fmt, ...) {
	LOGGER_FORWARD(LOG_SEVERITY_INFO);
}

void Logger::notice(const char *fmt, ...) {
	LOGGER_FORWARD(LOG_SEVERITY_NOTICE);
}

void Logger::warning(const char *fmt, ...) {
	LOGGER_FORWARD(LOG_SEVERITY_WARNING);
}

void Logger::err(const char *fmt, ...) {
	LOGGER_FORWARD(LOG_SEVERITY_ERR);
}

void Logger::crit(const char *fmt, ...) {
	LOGGER_FORWARD(LOG_SEVERITY_CRIT);
}

void Logger::emerg(const char *fmt, ...) {
	LOGGER_FORWARD(LOG_SEVERITY_EMERG);
}

void Logger::slog(std::string moduleName, LogMessageSeverity severity, const char *fmt, ...) {
	va_list args;
	va_start(args, fmt);
	svlog(moduleName, severity, fmt, args);
	va_end(args);
}

bool Logger::resolveColorsLocked(void) {
	if(colorMode == LOG_COLORS_ON) {
		return true;
	}
	if(colorMode == LOG_COLORS_OFF) {
		return false;
	}
	if(colorsEligible < 0) {
		colorsEligible = isatty(fileno(outFile)) ? 1 : 0;
	}
	return colorsEligible == 1;
}

void Logger::svlog(std::string moduleName, LogMessageSeverity severity, const char *fmt, va_list args) {
	if(moduleName.find('%') != string::npos) {
		throw invalid_argument("Logger moduleName must not contain a percent sign.");
	}

	Logger_Lock();
	LogMessageSeverity mySeverityFilter = severityFilter;
	bool myColors = resolveColorsLocked();
	Logger_Unlock();

	//Drop messages according to the logging filter.
	if(severity > mySeverityFilter) {
		return;
	}

	uint64_t nowMilli = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
	time_t nowSeconds = (time_t)(nowMilli / 1000);
	struct tm myTm;
	localtime_r(&nowSeconds, &myTm);
	char timeIntermediate[64];
	strftime(timeIntermediate, sizeof(timeIntermediate), "%F %H:%M:%S", &myTm);
	char timeString[96];
	snprintf(timeString, sizeof(timeString), "%s.%03u", timeIntermediate, (unsigned int)(nowMilli % 1000));

	string prefixFormat = "[" + (string)timeString + "] ";
	if(myColors) {
		prefixFormat += getSeverityColorCode(severity);
	}
	prefixFormat += getSeverityString(severity) + ": " + moduleName + ": ";
	if(prefixFormat.find('%') != string::npos) {
		throw logic_error("Logger error, log line prefix is invalid!");
	}
	string suffixFormat = myColors ? CONSOLE_COLOR_RESETALL "\n" : "\n";
	string finalFormat = prefixFormat + Utilities::stringTrim((string)fmt) + suffixFormat;

	Logger_Lock();
	vfprintf(outFile, finalFormat.c_str(), args);
	fflush(outFile);
	Logger_Unlock();
}

void Logger::setLoggingTarget(std::string filePath) {
	FILE *myFile;
	if((myFile = fopen(filePath.c_str(), "wb")) == NULL) {
		throw invalid_argument("setLoggingTarget() failed because we could not open the destination file for writing!");
	}
	setLoggingTarget(myFile);

	// Remember that we own this file, so it can be closed later.
	Logger_Lock();
	outFileOpened = true;
	Logger_Unlock();
}

void Logger::setLoggingTarget(FILE *file) {
	Logger_Lock();
	if(outFileOpened) {
		fclose(outFile);
		outFileOpened = false;
	}
	outFile = file;
	colorsEligible = -1;
	Logger_Unlock();
}

void Logger::setLoggingColorMode(LogColorModes mode) {
	Logger_Lock();
	colorMode = mode;
	Logger_Unlock();
}

void Logger::setLoggingFilter(LogMessageSeverity severity) {
	Logger_Lock();
	severityFilter = severity > LOG_SEVERITY_MAX ? LOG_SEVERITY_MAX : severity;
	Logger_Unlock();
}

LogMessageSeverity Logger::getLoggingFilter(void) {
	Logger_Lock();
	LogMessageSeverity filter = severityFilter;
	Logger_Unlock();
	return filter;
}

std::string Logger::getSeverityString(LogMessageSeverity severity) {
	switch(severity) {
		case LOG_SEVERITY_EMERG:
			return "EMERGENCY";
		case LOG_SEVERITY_ALERT:
			return "ALERT";
		case LOG_SEVERITY_CRIT:
			return "CRITICAL";
		case LOG_SEVERITY_ERR:
			return "ERROR";
		case LOG_SEVERITY_WARNING:
			return "WARNING";
		case LOG_SEVERITY_NOTICE:
			return "NOTICE";
		case LOG_SEVERITY_INFO:
			return "INFO";
		case LOG_SEVERITY_DEBUG1:
			return "DEBUG1";
		case LOG_SEVERITY_DEBUG2:
			return "DEBUG2";
		case LOG_SEVERITY_DEBUG3:
			return "DEBUG3";
		case LOG_SEVERITY_DEBUG4:
			return "DEBUG4";
	}
	return "?????";
}

const char *Logger::getSeverityColorCode(LogMessageSeverity severity) {
	switch(severity) {
		case LOG_SEVERITY_EMERG:
		case LOG_SEVERITY_ALERT:
			return CONSOLE_FONT_BOLD_ON CONSOLE_FONT_REVERSE_ON CONSOLE_COLOR_FOREGROUND_RED;
		case LOG_SEVERITY_CRIT:
			return CONSOLE_FONT_BOLD_ON CONSOLE_COLOR_FOREGROUND_RED;
		case LOG_SEVERITY_ERR:
			return CONSOLE_COLOR_FOREGROUND_RED;
		case LOG_SEVERITY_WARNING:
			return CONSOLE_COLOR_FOREGROUND_YELLOW;
		case LOG_SEVERITY_NOTICE:
			return CONSOLE_COLOR_FOREGROUND_BLUE;
		case LOG_SEVERITY_INFO:
			return CONSOLE_COLOR_FOREGROUND_CYAN;
		case LOG_SEVERITY_DEBUG1:
			return "";
		case LOG_SEVERITY_DEBUG2:
			return CONSOLE_COLOR_FOREGROUND_LIGHTGRAY;
		case LOG_SEVERITY_DEBUG3:
			return CONSOLE_FONT_DIM_ON;
		case LOG_SEVERITY_DEBUG4:
			return CONSOLE_FONT_DIM_ON CONSOLE_COLOR_FOREGROUND_LIGHTGRAY;
	}
	return "";
}

}; //namespace EyeTrack
