#pragma once

#include "Logger.hpp"

#include "SDL.h"
#include "opencv2/core.hpp"
#include "nlohmann/json.hpp"

#include <cinttypes>
#include <exception>
#include <stdexcept>
#include <string>
#include <vector>

using namespace std;
using json = nlohmann::json;

namespace EyeTrack {

#define EYETRACK_PATH_SEP "/"

#ifndef EYETRACK_DATA_DIR
#define EYETRACK_DATA_DIR "share" EYETRACK_PATH_SEP "eyetrack-core"
#endif

using cstr = const char * const;

static constexpr cstr portableBasename(cstr str, cstr lastSep) {
	return
		// If str is pointing to the end of the string, return lastSep
		*str == '\0' ? lastSep :
			// Otherwise, if str is pointing to a valid path separator, remember and recurse.
			(*str == '/' || *str =='\\') ? portableBasename(str + 1, str + 1) :
				// Otherwise, leave the last known valid separator alone and recurse.
				portableBasename(str + 1, lastSep);
}

static constexpr cstr portableBasename(cstr str) {
	return portableBasename(str, str);
}

#define EYETRACK_FILE ({constexpr cstr sf__ {portableBasename(__FILE__)}; sf__;})

#define EyeTrack_MutexLock(X) do {														\
	if(SDL_LockMutex(X) != 0) {															\
		EyeTrack_SLog("Utilities", LOG_SEVERITY_CRIT, "Failed to lock mutex "			\
			"%s (%p). Error was: %s", #X, (void *)X, SDL_GetError());					\
		throw runtime_error("Failed to lock mutex.");									\
	}																					\
} while(0)

#define EyeTrack_MutexUnlock(X) do {													\
	if(SDL_UnlockMutex(X) != 0) {														\
		EyeTrack_SLog("Utilities", LOG_SEVERITY_CRIT, "Failed to unlock mutex "			\
			"%s (%p). Error was: %s", #X, (void *)X, SDL_GetError());					\
		throw runtime_error("Failed to unlock mutex.");									\
	}																					\
} while(0)

#define EyeTrack_CarefullyDelete(logger, status, x) do {				\
	try {																\
		delete x;														\
		x = NULL;														\
	} catch(exception &e) {												\
		logger->emerg("%s Destructor exception: %s", #x, e.what());		\
		status->setEmergency();											\
	}																	\
} while(0)

#define EyeTrack_CarefullyDelete_NoStatus(logger, x) do {				\
	try {																\
		delete x;														\
		x = NULL;														\
	} catch(exception &e) {												\
		logger->emerg("%s Destructor exception: %s", #x, e.what());		\
	}																	\
} while(0)

class Logger;

class Utilities {
public:
	static double lineDistance(cv::Point2d a, cv::Point2d b);
	static bool rectFitsInside(cv::Rect rect, cv::Size bounds);
	static void drawX(cv::Mat frame, cv::Point2d markerPoint, cv::Scalar color = cv::Scalar(0, 0, 255), int lineLength = 5, int thickness = 1);
	static bool parseDouble(json value, double *result);
	static bool stringEndMatches(string haystack, string needle);
	static bool fileExists(string filePath);
	static string fileSearchInCommonLocations(string filePath);
	static string fileValidPathOrDie(string filePath, bool searchOnly = false);
	static string stringTrim(std::string str);
	static string stringTrimLeft(std::string str);
	static string stringTrimRight(std::string str);

private:
	static Logger *logger;
	static char *sdlDataPath;
};

typedef intmax_t FrameNumber;
#define EYETRACK_FRAMENUMBER_FORMATINNER PRIdMAX
#define EYETRACK_FRAMENUMBER_FORMAT "%" EYETRACK_FRAMENUMBER_FORMATINNER

}; //namespace EyeTrack
