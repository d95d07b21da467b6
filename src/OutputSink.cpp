#include "OutputSink.hpp"

#include "opencv2/imgproc.hpp"

#include <utility>

using namespace std;
using namespace cv;

namespace EyeTrack {

OutputSink::OutputSink(string myName, OutputQueue *myOutputQueue) {
	name = myName;
	outputQueue = myOutputQueue;
	if(outputQueue == NULL) {
		throw invalid_argument("outputQueue cannot be NULL");
	}
	mismatchCount = 0;
	logger = new Logger("OutputSink<" + name + ">");
	logger->debug1("OutputSink object constructed and ready to go!");
}

OutputSink::~OutputSink() {
	logger->debug1("OutputSink object destructing...");
	delete logger;
}

bool OutputSink::toBGR(const Mat &frame, Mat *converted) {
	if(frame.empty() || frame.depth() != CV_8U) {
		return false;
	}
	switch(frame.channels()) {
		default:
			return false;
		case 1:
			cvtColor(frame, *converted, COLOR_GRAY2BGR);
			return true;
		case 3:
			*converted = frame;
			return true;
		case 4:
			cvtColor(frame, *converted, COLOR_BGRA2BGR);
			return true;
	}
}

bool OutputSink::composeDiagnostic(const Mat &workingGray, const Mat &diagnosticFrame, Mat *composed) {
	if(workingGray.size() != diagnosticFrame.size()) {
		return false;
	}
	Mat left, right;
	if(!toBGR(workingGray, &left) || !toBGR(diagnosticFrame, &right)) {
		return false;
	}
	hconcat(left, right, *composed);
	return true;
}

// Counts and logs a mismatch so the caller can drop the tick before touching any tracking state.
bool OutputSink::compose(const Mat &workingGray, const Mat &diagnosticFrame, FrameNumber frameNumber, Mat *composed) {
	if(!composeDiagnostic(workingGray, diagnosticFrame, composed)) {
		mismatchCount++;
		logger->err("Size of frames to display are of unequal sizes (%dx%d vs %dx%d). Dropping output for frame " EYETRACK_FRAMENUMBER_FORMAT ".", workingGray.cols, workingGray.rows, diagnosticFrame.cols, diagnosticFrame.rows, frameNumber);
		return false;
	}
	return true;
}

void OutputSink::publish(Mat &composed, GazeRecord record, FrameNumber frameNumber) {
	EyeOutput output;
	output.diagnosticImage = std::move(composed);
	output.record = record;
	output.frameNumber = frameNumber;
	outputQueue->push(std::move(output));
}

size_t OutputSink::getMismatchCount(void) {
	return mismatchCount;
}

} //namespace EyeTrack
