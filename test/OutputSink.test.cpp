#include "gtest/gtest.h"
#include "gmock/gmock.h"

#include "GazeRecord.hpp"
#include "OutputQueue.hpp"
#include "OutputSink.hpp"
#include "TestSupport.hpp"

using namespace cv;
using namespace EyeTrack;
using namespace EyeTrack::Testing;

namespace {

TEST(OutputSink, PlacesTheGrayFrameLeftOfTheDiagnostic) {
	Mat gray(30, 40, CV_8UC1, Scalar(90));
	Mat diagnostic(30, 40, CV_8UC3, Scalar(0, 0, 255));
	Mat composed;
	ASSERT_TRUE(OutputSink::composeDiagnostic(gray, diagnostic, &composed));
	ASSERT_EQ(composed.size(), Size(80, 30));
	ASSERT_EQ(composed.type(), CV_8UC3);
	ASSERT_EQ(composed.at<Vec3b>(10, 10), Vec3b(90, 90, 90));
	ASSERT_EQ(composed.at<Vec3b>(10, 50), Vec3b(0, 0, 255));
}

TEST(OutputSink, AnySizeDifferenceIsAMismatch) {
	Mat composed;
	ASSERT_FALSE(OutputSink::composeDiagnostic(Mat(30, 40, CV_8UC1), Mat(30, 41, CV_8UC3), &composed));
	ASSERT_FALSE(OutputSink::composeDiagnostic(Mat(30, 40, CV_8UC1), Mat(31, 40, CV_8UC3), &composed));
	ASSERT_FALSE(OutputSink::composeDiagnostic(Mat(), Mat(), &composed));
}

TEST(OutputSink, PublishesRecordAndImageTogether) {
	OutputQueue queue(makeTestConfig(), "test");
	OutputSink sink("test", &queue);
	GazeRecord record(GAZE_ORIGIN_EDGE, 0.25, -0.5, false);
	Mat composed;
	ASSERT_TRUE(sink.compose(Mat(20, 20, CV_8UC1, Scalar(0)), Mat(20, 20, CV_8UC3, Scalar(0, 0, 0)), 42, &composed));
	sink.publish(composed, record, 42);

	EyeOutput output;
	ASSERT_TRUE(queue.pop(&output, 10));
	ASSERT_EQ(output.frameNumber, 42);
	ASSERT_EQ(output.record.origin, GAZE_ORIGIN_EDGE);
	ASSERT_DOUBLE_EQ(output.record.x, 0.25);
	ASSERT_DOUBLE_EQ(output.record.y, -0.5);
	ASSERT_EQ(output.diagnosticImage.size(), Size(40, 20));
}

TEST(OutputSink, MismatchIsCountedAndQueuesNothing) {
	OutputQueue queue(makeTestConfig(), "test");
	OutputSink sink("test", &queue);
	Mat composed;
	ASSERT_FALSE(sink.compose(Mat(20, 20, CV_8UC1), Mat(10, 10, CV_8UC3), 1, &composed));
	ASSERT_FALSE(sink.compose(Mat(20, 20, CV_8UC1), Mat(), 2, &composed));
	ASSERT_EQ(sink.getMismatchCount(), 2u);
	ASSERT_EQ(queue.getSize(), 0u);
}

TEST(GazeRecord, SerializesBlinkWithoutCoordinates) {
	json blink = GazeRecord(GAZE_ORIGIN_HYBRID, 0.0, 0.0, true).toJSON();
	ASSERT_EQ(blink["origin"], "hybrid");
	ASSERT_EQ(blink["blink"], true);
	ASSERT_TRUE(blink["x"].is_null());
	ASSERT_TRUE(blink["y"].is_null());

	json sample = GazeRecord(GAZE_ORIGIN_MODEL, 0.5, -0.25, false).toJSON();
	ASSERT_EQ(sample["origin"], "model");
	ASSERT_DOUBLE_EQ(sample["x"].get<double>(), 0.5);
	ASSERT_DOUBLE_EQ(sample["y"].get<double>(), -0.25);
	ASSERT_TRUE(GazeRecord(GAZE_ORIGIN_MODEL, 0.5, -0.25, false).isGazeSample());
	ASSERT_FALSE(GazeRecord().isGazeSample());
}

} //namespace
