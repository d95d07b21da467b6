#include "FramePreprocessor.hpp"

#include "opencv2/imgproc.hpp"

using namespace std;
using namespace cv;

namespace EyeTrack {

FramePreprocessor::FramePreprocessor(string myName) {
	name = myName;
	lastRotationAngle = 0.0;
	logger = new Logger("FramePreprocessor<" + name + ">");
	logger->debug1("FramePreprocessor object constructed and ready to go!");
}

FramePreprocessor::~FramePreprocessor() {
	logger->debug1("FramePreprocessor object destructing...");
	delete logger;
}

bool FramePreprocessor::process(const Mat &frame, Rect roi, double rotationAngle, PreprocessedFrame *result) {
	if(result == NULL) {
		throw invalid_argument("result cannot be NULL");
	}
	result->usedFallback = false;
	if(!cropFrame(frame, roi, &result->cropped)) {
		if(lastAccepted.empty()) {
			logger->err("Frame capture issue detected and there is no previous frame to fall back on. Skipping this frame.");
			return false;
		}
		logger->err("Frame capture issue detected. Reusing the previous frame.");
		result->cropped = lastAccepted;
		result->usedFallback = true;
	}

	result->color = rotateFrame(result->cropped, rotationAngle);
	cvtColor(result->color, result->gray, COLOR_BGR2GRAY);
	result->cleanGray = result->gray.clone();
	return true;
}

void FramePreprocessor::acceptFrame(const PreprocessedFrame &accepted, double rotationAngle) {
	lastAccepted = accepted.cropped;
	if(rotationAngle != lastRotationAngle) {
		logger->debug2("Rotation angle changed from %.02lf to %.02lf degrees.", lastRotationAngle, rotationAngle);
	}
	lastRotationAngle = rotationAngle;
}

bool FramePreprocessor::hasAcceptedFrame(void) {
	return !lastAccepted.empty();
}

double FramePreprocessor::getLastRotationAngle(void) {
	return lastRotationAngle;
}

void FramePreprocessor::reset(void) {
	lastAccepted.release();
	lastRotationAngle = 0.0;
}

bool FramePreprocessor::normalizeFrame(const Mat &frame, Mat *normalized) {
	if(frame.empty() || frame.depth() != CV_8U) {
		return false;
	}
	switch(frame.channels()) {
		default:
			return false;
		case 1:
			cvtColor(frame, *normalized, COLOR_GRAY2BGR);
			return true;
		case 3:
			*normalized = frame;
			return true;
		case 4:
			cvtColor(frame, *normalized, COLOR_BGRA2BGR);
			return true;
	}
}

bool FramePreprocessor::cropFrame(const Mat &frame, Rect roi, Mat *cropped) {
	Mat normalized;
	if(!normalizeFrame(frame, &normalized)) {
		return false;
	}
	if(!Utilities::rectFitsInside(roi, normalized.size())) {
		return false;
	}
	*cropped = normalized(roi).clone();
	return true;
}

// Rotates about the frame's own center without changing the canvas size.
// Uncovered pixels are filled with neutral gray rather than black or white.
Mat FramePreprocessor::rotateFrame(const Mat &frame, double rotationAngle) {
	if(rotationAngle == 0.0) {
		return frame.clone();
	}
	Point2f center((float)frame.cols / 2.0f, (float)frame.rows / 2.0f);
	Mat rotationMatrix = getRotationMatrix2D(center, rotationAngle, 1.0);
	Mat rotated;
	warpAffine(frame, rotated, rotationMatrix, frame.size(), INTER_LINEAR, BORDER_CONSTANT, Scalar(FRAMEPREPROCESSOR_BORDER_GRAY, FRAMEPREPROCESSOR_BORDER_GRAY, FRAMEPREPROCESSOR_BORDER_GRAY));
	return rotated;
}

} //namespace EyeTrack
