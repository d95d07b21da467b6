#pragma once

#include "GazeRecord.hpp"
#include "Logger.hpp"
#include "OutputQueue.hpp"
#include "Utilities.hpp"

#include "opencv2/core.hpp"

#include <string>

using namespace std;

namespace EyeTrack {

class OutputSink {
public:
	OutputSink(string myName, OutputQueue *myOutputQueue);
	~OutputSink();
	bool compose(const cv::Mat &workingGray, const cv::Mat &diagnosticFrame, FrameNumber frameNumber, cv::Mat *composed);
	void publish(cv::Mat &composed, GazeRecord record, FrameNumber frameNumber);
	static bool composeDiagnostic(const cv::Mat &workingGray, const cv::Mat &diagnosticFrame, cv::Mat *composed);
	size_t getMismatchCount(void);
private:
	static bool toBGR(const cv::Mat &frame, cv::Mat *converted);

	string name;
	OutputQueue *outputQueue;
	size_t mismatchCount;

	Logger *logger;
};

}; //namespace EyeTrack
