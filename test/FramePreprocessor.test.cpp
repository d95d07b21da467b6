#include "gtest/gtest.h"
#include "gmock/gmock.h"

#include "FramePreprocessor.hpp"
#include "TestSupport.hpp"

#include "opencv2/imgproc.hpp"

using namespace cv;
using namespace EyeTrack;
using namespace EyeTrack::Testing;

namespace {

TEST(FramePreprocessor, OutputMatchesTheROIAtAnyAngle) {
	FramePreprocessor preprocessor("test");
	Mat frame = makeDarkDiskFrame(Size(320, 240), Point(160, 120), 20);
	Rect roi(100, 60, 90, 70);
	for(double angle : {0.0, 15.0, 45.0, 90.0, 180.0, 275.5, -30.0}) {
		PreprocessedFrame result;
		ASSERT_TRUE(preprocessor.process(frame, roi, angle, &result));
		ASSERT_EQ(result.color.size(), roi.size()) << "angle " << angle;
		ASSERT_EQ(result.gray.size(), roi.size()) << "angle " << angle;
		ASSERT_EQ(result.gray.type(), CV_8UC1);
		ASSERT_EQ(result.color.type(), CV_8UC3);
		ASSERT_FALSE(result.usedFallback);
	}
}

TEST(FramePreprocessor, ZeroAngleIsAPlainCrop) {
	Mat frame(50, 50, CV_8UC3, Scalar(10, 20, 30));
	frame(Rect(10, 10, 5, 5)).setTo(Scalar(255, 255, 255));
	Mat cropped;
	ASSERT_TRUE(FramePreprocessor::cropFrame(frame, Rect(10, 10, 20, 20), &cropped));
	Mat rotated = FramePreprocessor::rotateFrame(cropped, 0.0);
	ASSERT_EQ(rotated.at<Vec3b>(0, 0), Vec3b(255, 255, 255));
	ASSERT_EQ(rotated.at<Vec3b>(19, 19), Vec3b(10, 20, 30));
}

TEST(FramePreprocessor, UncoveredCornersAreNeutralGray) {
	Mat frame(100, 100, CV_8UC3, Scalar(255, 255, 255));
	Mat rotated = FramePreprocessor::rotateFrame(frame, 45.0);
	ASSERT_EQ(rotated.size(), frame.size());
	Vec3b corner = rotated.at<Vec3b>(0, 0);
	ASSERT_EQ(corner, Vec3b(FRAMEPREPROCESSOR_BORDER_GRAY, FRAMEPREPROCESSOR_BORDER_GRAY, FRAMEPREPROCESSOR_BORDER_GRAY));
	ASSERT_EQ(rotated.at<Vec3b>(50, 50), Vec3b(255, 255, 255));
}

TEST(FramePreprocessor, ROIMustFitInsideTheFrame) {
	Mat frame(100, 100, CV_8UC3, Scalar(0, 0, 0));
	Mat cropped;
	ASSERT_TRUE(FramePreprocessor::cropFrame(frame, Rect(0, 0, 100, 100), &cropped));
	ASSERT_FALSE(FramePreprocessor::cropFrame(frame, Rect(1, 0, 100, 100), &cropped));
	ASSERT_FALSE(FramePreprocessor::cropFrame(frame, Rect(-1, 0, 10, 10), &cropped));
	ASSERT_FALSE(FramePreprocessor::cropFrame(frame, Rect(0, 0, 0, 10), &cropped));
	ASSERT_FALSE(FramePreprocessor::cropFrame(Mat(), Rect(0, 0, 10, 10), &cropped));
	ASSERT_FALSE(FramePreprocessor::cropFrame(Mat(100, 100, CV_32FC1, Scalar(0.0)), Rect(0, 0, 10, 10), &cropped));
}

TEST(FramePreprocessor, SingleAndFourChannelFramesArePromoted) {
	Mat cropped;
	ASSERT_TRUE(FramePreprocessor::cropFrame(Mat(40, 40, CV_8UC1, Scalar(77)), Rect(5, 5, 10, 10), &cropped));
	ASSERT_EQ(cropped.type(), CV_8UC3);
	ASSERT_EQ(cropped.at<Vec3b>(0, 0), Vec3b(77, 77, 77));
	ASSERT_TRUE(FramePreprocessor::cropFrame(Mat(40, 40, CV_8UC4, Scalar(1, 2, 3, 4)), Rect(5, 5, 10, 10), &cropped));
	ASSERT_EQ(cropped.type(), CV_8UC3);
	ASSERT_EQ(cropped.at<Vec3b>(0, 0), Vec3b(1, 2, 3));
}

TEST(FramePreprocessor, FailureWithoutHistorySkipsTheFrame) {
	FramePreprocessor preprocessor("test");
	PreprocessedFrame result;
	ASSERT_FALSE(preprocessor.process(Mat(), Rect(0, 0, 10, 10), 0.0, &result));
	ASSERT_FALSE(preprocessor.hasAcceptedFrame());
}

TEST(FramePreprocessor, FailureReusesTheLastAcceptedFrame) {
	FramePreprocessor preprocessor("test");
	Rect roi(0, 0, 100, 100);
	PreprocessedFrame good;
	ASSERT_TRUE(preprocessor.process(makeDarkDiskFrame(Size(100, 100), Point(50, 50), 15), roi, 0.0, &good));

	PreprocessedFrame result;
	ASSERT_FALSE(preprocessor.process(Mat(), roi, 0.0, &result));
	preprocessor.acceptFrame(good, 0.0);
	ASSERT_TRUE(preprocessor.hasAcceptedFrame());

	ASSERT_TRUE(preprocessor.process(Mat(), roi, 0.0, &result));
	ASSERT_TRUE(result.usedFallback);
	ASSERT_EQ(result.gray.size(), roi.size());
	ASSERT_EQ(result.gray.at<uchar>(50, 50), 0);
	ASSERT_EQ(result.gray.at<uchar>(2, 2), 200);

	preprocessor.reset();
	ASSERT_FALSE(preprocessor.process(Mat(), roi, 0.0, &result));
}

TEST(FramePreprocessor, FallbackIsRotatedWithTheCurrentAngle) {
	FramePreprocessor preprocessor("test");
	Rect roi(0, 0, 100, 100);
	PreprocessedFrame good;
	ASSERT_TRUE(preprocessor.process(Mat(100, 100, CV_8UC3, Scalar(255, 255, 255)), roi, 0.0, &good));
	preprocessor.acceptFrame(good, 0.0);

	PreprocessedFrame result;
	ASSERT_TRUE(preprocessor.process(Mat(), roi, 45.0, &result));
	ASSERT_EQ(result.gray.at<uchar>(0, 0), FRAMEPREPROCESSOR_BORDER_GRAY);
	preprocessor.acceptFrame(result, 45.0);
	ASSERT_EQ(preprocessor.getLastRotationAngle(), 45.0);
}

TEST(FramePreprocessor, CleanGrayIsIndependentOfTheWorkingCopy) {
	FramePreprocessor preprocessor("test");
	PreprocessedFrame result;
	ASSERT_TRUE(preprocessor.process(Mat(30, 30, CV_8UC3, Scalar(100, 100, 100)), Rect(0, 0, 30, 30), 0.0, &result));
	result.gray.setTo(Scalar(0));
	ASSERT_EQ(result.cleanGray.at<uchar>(10, 10), 100);
}

} //namespace
