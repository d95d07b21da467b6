#include "gtest/gtest.h"
#include "gmock/gmock.h"

#include "EdgeDetector.hpp"
#include "HybridDetector.hpp"
#include "ModelDetector.hpp"
#include "TestSupport.hpp"

#include "opencv2/imgproc.hpp"

using namespace cv;
using namespace EyeTrack;
using namespace EyeTrack::Testing;

namespace {

Mat grayDisk(Point center, int radius) {
	Mat gray;
	cvtColor(makeDarkDiskFrame(Size(100, 100), center, radius), gray, COLOR_BGR2GRAY);
	return gray;
}

EngineParameters defaultParameters(void) {
	return EngineParameters::fromSettings(EyeSettings(), Size(100, 100));
}

TEST(EdgeDetector, FitsTheDiskOutline) {
	EdgeDetector detector(defaultParameters());
	ASSERT_EQ(detector.getAlgorithm(), DETECTOR_EDGE);
	DetectorResult result = detector.run(grayDisk(Point(45, 55), 15));
	ASSERT_TRUE(result.found);
	ASSERT_NEAR(result.center.x, 45.0, 2.0);
	ASSERT_NEAR(result.center.y, 55.0, 2.0);
	ASSERT_EQ(result.diagnosticFrame.size(), Size(100, 100));
	ASSERT_TRUE(result.replacementGray.empty());
}

TEST(EdgeDetector, FlatFrameHasNoEdges) {
	EdgeDetector detector(defaultParameters());
	ASSERT_FALSE(detector.run(Mat(100, 100, CV_8UC1, Scalar(120))).found);
}

TEST(EdgeDetector, RadiusEstimateAdaptsUnlessSkipped) {
	EngineParameters parameters = defaultParameters();
	EdgeDetector adaptive(parameters);
	double before = adaptive.getRadiusEstimate();
	adaptive.run(grayDisk(Point(50, 50), 25));
	ASSERT_GT(adaptive.getRadiusEstimate(), before);

	parameters.skipAutoRadius = true;
	EdgeDetector fixed(parameters);
	ASSERT_DOUBLE_EQ(fixed.getRadiusEstimate(), (double)parameters.pupilRadius);
	ASSERT_TRUE(fixed.run(grayDisk(Point(50, 50), 25)).found);
	ASSERT_DOUBLE_EQ(fixed.getRadiusEstimate(), (double)parameters.pupilRadius);
}

TEST(HybridDetector, ReplacesTheWorkingFrameWithItsSearchWindow) {
	HybridDetector detector(defaultParameters());
	ASSERT_EQ(detector.getAlgorithm(), DETECTOR_HYBRID);
	DetectorResult result = detector.run(grayDisk(Point(50, 50), 15));
	ASSERT_TRUE(result.found);
	ASSERT_FALSE(result.replacementGray.empty());
	ASSERT_EQ(result.replacementGray.size(), result.diagnosticFrame.size());
	ASSERT_EQ(result.replacementGray.size(), detector.getLastSearchWindow().size());
	ASSERT_LT(result.replacementGray.cols, 100);
	ASSERT_NEAR(result.center.x, 50.0, 2.0);
	ASSERT_NEAR(result.center.y, 50.0, 2.0);
}

TEST(ModelDetector, ReportsThePupilBeforeTheModelConverges) {
	ModelDetector detector(defaultParameters());
	ASSERT_EQ(detector.getAlgorithm(), DETECTOR_MODEL);
	DetectorResult result = detector.run(grayDisk(Point(50, 50), 12));
	ASSERT_TRUE(result.found);
	ASSERT_FALSE(detector.getModelIsReady());
	ASSERT_NEAR(result.center.x, 50.0, 2.0);
	ASSERT_NEAR(result.center.y, 50.0, 2.0);
	ASSERT_EQ(result.diagnosticFrame.size(), Size(100, 100));
}

TEST(ModelDetector, FocalLengthChangeResetsTheModel) {
	EngineParameters parameters = defaultParameters();
	ModelDetector detector(parameters);
	double radius = detector.getSphereRadius();
	parameters.focalLength = 15.0;
	detector.updateTuning(parameters);
	ASSERT_LT(detector.getSphereRadius(), radius);
	ASSERT_EQ(detector.getSphereCenter(), Point2d(50.0, 50.0));
	ASSERT_FALSE(detector.getModelIsReady());
}

} //namespace
