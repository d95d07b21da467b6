#include "Utilities.hpp"

#include "opencv2/imgproc.hpp"

#define _USE_MATH_DEFINES
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <sys/stat.h>

using namespace std;
using namespace cv;

namespace EyeTrack {

double Utilities::lineDistance(Point2d a, Point2d b) {
	Point2d d = a - b;
	return std::sqrt(std::pow(d.x, 2.0) + std::pow(d.y, 2.0));
}

bool Utilities::rectFitsInside(Rect rect, Size bounds) {
	if(rect.width <= 0 || rect.height <= 0) {
		return false;
	}
	if(rect.x < 0 || rect.y < 0) {
		return false;
	}
	return (rect.x + rect.width) <= bounds.width && (rect.y + rect.height) <= bounds.height;
}

void Utilities::drawX(Mat frame, Point2d markerPoint, Scalar color, int lineLength, int thickness) {
	Point2d a, b;
	a.x = markerPoint.x;
	a.y = markerPoint.y - lineLength;
	b.x = markerPoint.x;
	b.y = markerPoint.y + lineLength;
	line(frame, a, b, color, thickness, LINE_AA);
	a.x = markerPoint.x - lineLength;
	a.y = markerPoint.y;
	b.x = markerPoint.x + lineLength;
	b.y = markerPoint.y;
	line(frame, a, b, color, thickness, LINE_AA);
}

// Accepts either a JSON number or a string holding one, the way values arrive
// from a text field. Anything else (or a non-finite number) is rejected.
bool Utilities::parseDouble(json value, double *result) {
	double parsed;
	if(value.is_number()) {
		parsed = value.get<double>();
	} else if(value.is_string()) {
		string text = stringTrim(value.get<string>());
		if(text.length() == 0) {
			return false;
		}
		char *end = NULL;
		parsed = strtod(text.c_str(), &end);
		if(end == NULL || *end != '\0') {
			return false;
		}
	} else {
		return false;
	}
	if(!std::isfinite(parsed)) {
		return false;
	}
	*result = parsed;
	return true;
}

bool Utilities::stringEndMatches(string haystack, string needle) {
	int start = (int)haystack.length() - (int)needle.length();
	if(start < 0) {
		return false;
	}
	return haystack.substr(start, string::npos) == needle;
}

bool Utilities::fileExists(string filePath) {
	struct stat buf;
	logger->debug2("Checking if \"%s\" exists.", filePath.c_str());
	return (stat(filePath.c_str(), &buf) == 0);
}

string Utilities::fileSearchInCommonLocations(string filePath) {
	if(sdlDataPath == NULL) {
		sdlDataPath = SDL_GetBasePath();
		logger->debug3("SDL Reports Data Path: %s", sdlDataPath);
	}

	vector<string> searchBases;
	if(sdlDataPath != NULL) {
		string sdlDataPathStr = (string)sdlDataPath;
		vector<string> baseTrims = {
			"usr" EYETRACK_PATH_SEP "local" EYETRACK_PATH_SEP "bin" EYETRACK_PATH_SEP,
			"usr" EYETRACK_PATH_SEP "bin" EYETRACK_PATH_SEP,
			"bin" EYETRACK_PATH_SEP
		};
		for(string baseTrim : baseTrims) {
			if(stringEndMatches(sdlDataPathStr, baseTrim)) {
				searchBases.push_back(sdlDataPathStr.substr(0, sdlDataPathStr.length() - baseTrim.length()));
			}
		}
		searchBases.push_back(sdlDataPathStr);
	}
	searchBases.push_back("." EYETRACK_PATH_SEP);
	searchBases.push_back(EYETRACK_PATH_SEP);

	vector<string> searchSecondComponents = {
		"usr" EYETRACK_PATH_SEP "local" EYETRACK_PATH_SEP,
		"usr" EYETRACK_PATH_SEP,
		""
	};

	vector<string> searchThirdComponents = {
		EYETRACK_DATA_DIR EYETRACK_PATH_SEP,
		"data" EYETRACK_PATH_SEP,
		""
	};
	for(string searchBase : searchBases) {
		for(string searchSecondComponent : searchSecondComponents) {
			for(string searchThirdComponent : searchThirdComponents) {
				string testPath = searchBase + searchSecondComponent + searchThirdComponent + filePath;
				logger->debug4("TEST PATH: %s", testPath.c_str());
				if(fileExists(testPath)) {
					return testPath;
				}
			}
		}
	}
	return "";
}

string Utilities::fileValidPathOrDie(string filePath, bool searchOnly) {
	if(!searchOnly) {
		if(fileExists(filePath)) {
			return filePath;
		}
	}
	string result = Utilities::fileSearchInCommonLocations(filePath);
	if(result == "") {
		logger->err("Could not find \"%s\"!", filePath.c_str());
		throw runtime_error("File or directory does not exist.");
	}
	return result;
}

string Utilities::stringTrim(std::string str) {
	return stringTrimRight(stringTrimLeft(str));
}

string Utilities::stringTrimLeft(std::string str) {
	auto last = std::find_if(str.begin(), str.end(), [](int ch) {
		return !std::isspace(ch);
	});
	str.erase(str.begin(), last);
	return str;
}

string Utilities::stringTrimRight(std::string str) {
	auto first = std::find_if(str.rbegin(), str.rend(), [](int ch) {
		return !std::isspace(ch);
	}).base();
	str.erase(first, str.end());
	return str;
}

Logger *Utilities::logger = new Logger("Utilities");
char *Utilities::sdlDataPath = NULL;

}; //namespace EyeTrack
