#include "gtest/gtest.h"
#include "gmock/gmock.h"

#include "CaptureQueue.hpp"
#include "EyeProcessor.hpp"
#include "EyeSettings.hpp"
#include "OutputQueue.hpp"
#include "Status.hpp"
#include "TestSupport.hpp"

#include "SDL.h"
#include "opencv2/imgproc.hpp"

#include <stdexcept>

using namespace cv;
using namespace EyeTrack;
using namespace EyeTrack::Testing;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;
using ::testing::_;

namespace {

CapturedFrame makeCaptured(Mat frame, FrameNumber frameNumber) {
	CapturedFrame captured;
	captured.frame = frame;
	captured.frameNumber = frameNumber;
	captured.fps = 30.0;
	return captured;
}

Mat centeredDisk(void) {
	return makeDarkDiskFrame(Size(100, 100), Point(50, 50), 15);
}

DetectorResult fixedResult(Point2d center, Size diagnosticSize) {
	DetectorResult result;
	result.found = true;
	result.center = center;
	result.diagnosticFrame = Mat(diagnosticSize, CV_8UC3, Scalar(0, 255, 0));
	return result;
}

// Every engine the processor asks for becomes a mock that returns the given result.
DetectorEngineFactory mockFactory(DetectorResult result, int *constructed = NULL) {
	return [result, constructed](DetectorAlgorithm algorithm, const EngineParameters &parameters) {
		if(constructed != NULL) {
			(*constructed)++;
		}
		NiceMock<MockDetectorEngine> *engine = new NiceMock<MockDetectorEngine>();
		ON_CALL(*engine, getAlgorithm()).WillByDefault(Return(algorithm));
		ON_CALL(*engine, run(_)).WillByDefault(Return(result));
		return (DetectorEngine *)engine;
	};
}

class EyeProcessorTest: public ::testing::Test {
protected:
	EyeProcessorTest(void) {
		config = makeTestConfig();
		config["EyeTrack"]["EyeProcessor"]["frameWaitMilliseconds"] = 30;
		config["EyeTrack"]["EyeProcessor"]["roiWaitMilliseconds"] = 20;
		status = new Status();
		captureQueue = new CaptureQueue(config, "test");
		outputQueue = new OutputQueue(config, "test");
		settingsCell = NULL;
		processor = NULL;
	}

	~EyeProcessorTest() {
		if(processor != NULL) {
			status->requestCancellation();
			delete processor;
		}
		delete settingsCell;
		delete outputQueue;
		delete captureQueue;
		delete status;
	}

	void build(EyeSettings settings, DetectorEngineFactory factory = nullptr) {
		settingsCell = new SettingsCell(settings);
		processor = new EyeProcessor(config, status, "test", settingsCell, captureQueue, outputQueue, factory);
	}

	json config;
	Status *status;
	CaptureQueue *captureQueue;
	OutputQueue *outputQueue;
	SettingsCell *settingsCell;
	EyeProcessor *processor;
};

TEST_F(EyeProcessorTest, CenteredDiskWithBlobDetectorEmitsABlobRecord) {
	EyeSettings settings = makeBlobOnlySettings();
	build(settings);
	CapturedFrame captured = makeCaptured(centeredDisk(), 1);
	ASSERT_TRUE(processor->processFrame(captured, settings));

	EyeOutput output;
	ASSERT_TRUE(outputQueue->pop(&output, 10));
	ASSERT_EQ(output.frameNumber, 1);
	ASSERT_EQ(output.record.origin, GAZE_ORIGIN_BLOB);
	ASSERT_FALSE(output.record.blink);
	ASSERT_GE(output.record.x, -1.0);
	ASSERT_LE(output.record.x, 1.0);
	ASSERT_GE(output.record.y, -1.0);
	ASSERT_LE(output.record.y, 1.0);
	ASSERT_EQ(output.diagnosticImage.size(), Size(200, 100));

	ASSERT_TRUE(processor->getDetectorManager()->hasEngine(DETECTOR_BLOB));
	ASSERT_FALSE(processor->getDetectorManager()->hasEngine(DETECTOR_EDGE));
	ASSERT_FALSE(processor->getDetectorManager()->hasEngine(DETECTOR_HYBRID));
	ASSERT_FALSE(processor->getDetectorManager()->hasEngine(DETECTOR_MODEL));
	ASSERT_EQ(processor->getFramesPublished(), 1);
	ASSERT_EQ(processor->getDetectorMetrics()->getSummary().samples, 1u);
}

TEST_F(EyeProcessorTest, WorkerSurvivesAnEmptyQueueAndResumesWhenAFrameArrives) {
	build(makeBlobOnlySettings());
	processor->startThread();
	SDL_Delay(150);

	EyeOutput output;
	ASSERT_FALSE(outputQueue->pop(&output, 10));
	ASSERT_FALSE(status->getEmergency());

	ASSERT_TRUE(captureQueue->push(makeCaptured(centeredDisk(), 7), 100));
	ASSERT_TRUE(outputQueue->pop(&output, 2000));
	ASSERT_EQ(output.frameNumber, 7);
	ASSERT_EQ(output.record.origin, GAZE_ORIGIN_BLOB);

	status->requestCancellation();
	delete processor;
	processor = NULL;
	ASSERT_FALSE(status->getEmergency());
}

TEST_F(EyeProcessorTest, WorkerWaitsForAnROIWithoutBuildingDetectors) {
	EyeSettings settings = makeBlobOnlySettings();
	settings.roiWidth = 0;
	int constructed = 0;
	build(settings, mockFactory(fixedResult(Point2d(10.0, 10.0), Size(100, 100)), &constructed));
	ASSERT_TRUE(captureQueue->push(makeCaptured(centeredDisk(), 1), 10));

	ASSERT_TRUE(processor->loopIteration());
	processor->startThread();
	SDL_Delay(100);
	ASSERT_EQ(constructed, 0);
	ASSERT_EQ(captureQueue->getSize(), 1u);

	Uint32 cancelledAt = SDL_GetTicks();
	status->requestCancellation();
	delete processor;
	processor = NULL;
	ASSERT_LT(SDL_GetTicks() - cancelledAt, 1000u);
	ASSERT_EQ(constructed, 0);
	ASSERT_FALSE(status->getEmergency());
}

TEST_F(EyeProcessorTest, LoopIterationStopsOnceCancelled) {
	build(makeBlobOnlySettings());
	status->requestCancellation();
	ASSERT_FALSE(processor->loopIteration());
}

TEST_F(EyeProcessorTest, UnusableFirstFrameIsSkipped) {
	EyeSettings settings = makeBlobOnlySettings();
	int constructed = 0;
	build(settings, mockFactory(fixedResult(Point2d(10.0, 10.0), Size(100, 100)), &constructed));
	CapturedFrame captured = makeCaptured(Mat(), 1);
	ASSERT_FALSE(processor->processFrame(captured, settings));
	EyeOutput output;
	ASSERT_FALSE(outputQueue->pop(&output, 10));
	ASSERT_EQ(constructed, 0);
	ASSERT_FALSE(processor->getDetectorManager()->hasEngine(DETECTOR_BLOB));
	ASSERT_EQ(processor->getDetectorMetrics()->getSummary().samples, 0u);
}

TEST_F(EyeProcessorTest, EngineThatCannotBeBuiltSkipsTheFrameWithoutEmergency) {
	EyeSettings settings = makeBlobOnlySettings();
	build(settings);
	settings.pupilRadius = 0;
	settings.algorithms[DETECTOR_EDGE].enabled = true;
	settings.algorithms[DETECTOR_EDGE].priority = 1;
	settings.algorithms[DETECTOR_BLOB].priority = 2;
	CapturedFrame captured = makeCaptured(centeredDisk(), 1);
	ASSERT_FALSE(processor->processFrame(captured, settings));
	ASSERT_FALSE(status->getEmergency());
	EyeOutput output;
	ASSERT_FALSE(outputQueue->pop(&output, 10));
	ASSERT_EQ(processor->getFramesPublished(), 0);

	settings = makeBlobOnlySettings();
	captured = makeCaptured(centeredDisk(), 2);
	ASSERT_TRUE(processor->processFrame(captured, settings));
	ASSERT_TRUE(outputQueue->pop(&output, 10));
	ASSERT_EQ(output.frameNumber, 2);
}

TEST_F(EyeProcessorTest, ThrowingDetectorSkipsTheFrameWithoutEmergency) {
	EyeSettings settings = makeBlobOnlySettings();
	build(settings, [](DetectorAlgorithm algorithm, const EngineParameters &parameters) {
		NiceMock<MockDetectorEngine> *engine = new NiceMock<MockDetectorEngine>();
		ON_CALL(*engine, getAlgorithm()).WillByDefault(Return(algorithm));
		ON_CALL(*engine, run(_)).WillByDefault(Throw(std::runtime_error("detector fell over")));
		return (DetectorEngine *)engine;
	});
	CapturedFrame captured = makeCaptured(centeredDisk(), 1);
	ASSERT_FALSE(processor->processFrame(captured, settings));
	ASSERT_FALSE(status->getEmergency());
	ASSERT_FALSE(processor->getCalibrator()->getHasBounds());
}

TEST_F(EyeProcessorTest, CaptureFailureFallsBackToThePreviousFrame) {
	EyeSettings settings = makeBlobOnlySettings();
	build(settings);
	CapturedFrame good = makeCaptured(centeredDisk(), 1);
	ASSERT_TRUE(processor->processFrame(good, settings));
	CapturedFrame broken = makeCaptured(Mat(), 2);
	ASSERT_TRUE(processor->processFrame(broken, settings));
	CapturedFrame tooSmall = makeCaptured(Mat(20, 20, CV_8UC3, Scalar(0, 0, 0)), 3);
	ASSERT_TRUE(processor->processFrame(tooSmall, settings));

	EyeOutput output;
	ASSERT_TRUE(outputQueue->pop(&output, 10));
	ASSERT_TRUE(outputQueue->pop(&output, 10));
	ASSERT_EQ(output.frameNumber, 2);
	ASSERT_EQ(output.record.origin, GAZE_ORIGIN_BLOB);
	ASSERT_TRUE(outputQueue->pop(&output, 10));
	ASSERT_EQ(output.frameNumber, 3);
}

TEST_F(EyeProcessorTest, NoEnabledAlgorithmMeansNoOutput) {
	EyeSettings settings = makeBlobOnlySettings();
	settings.algorithms[DETECTOR_BLOB].enabled = false;
	build(settings);
	CapturedFrame captured = makeCaptured(centeredDisk(), 1);
	ASSERT_FALSE(processor->processFrame(captured, settings));
	EyeOutput output;
	ASSERT_FALSE(outputQueue->pop(&output, 10));
	ASSERT_EQ(processor->getFramesPublished(), 0);
}

TEST_F(EyeProcessorTest, NotFoundStillEmitsAFailureRecord) {
	EyeSettings settings = makeBlobOnlySettings();
	build(settings);
	CapturedFrame captured = makeCaptured(Mat(100, 100, CV_8UC3, Scalar(200, 200, 200)), 1);
	ASSERT_TRUE(processor->processFrame(captured, settings));
	EyeOutput output;
	ASSERT_TRUE(outputQueue->pop(&output, 10));
	ASSERT_EQ(output.record.origin, GAZE_ORIGIN_FAILURE);
	ASSERT_FALSE(output.record.isGazeSample());
	ASSERT_FALSE(processor->getCalibrator()->getHasBounds());
}

TEST_F(EyeProcessorTest, MismatchedDiagnosticIsDroppedAndNotKeptForFallback) {
	EyeSettings settings = makeBlobOnlySettings();
	build(settings, mockFactory(fixedResult(Point2d(10.0, 10.0), Size(50, 50))));
	CapturedFrame captured = makeCaptured(centeredDisk(), 1);
	ASSERT_FALSE(processor->processFrame(captured, settings));
	EyeOutput output;
	ASSERT_FALSE(outputQueue->pop(&output, 10));
	ASSERT_FALSE(processor->getCalibrator()->getHasBounds());
	ASSERT_FALSE(processor->getCalibrator()->getHasCenter());

	CapturedFrame broken = makeCaptured(Mat(), 2);
	ASSERT_FALSE(processor->processFrame(broken, settings));
}

TEST_F(EyeProcessorTest, ReplacementGrayBecomesTheWorkingFrame) {
	EyeSettings settings = makeBlobOnlySettings();
	DetectorResult result = fixedResult(Point2d(20.0, 15.0), Size(40, 30));
	result.replacementGray = Mat(30, 40, CV_8UC1, Scalar(128));
	build(settings, mockFactory(result));
	CapturedFrame captured = makeCaptured(centeredDisk(), 1);
	ASSERT_TRUE(processor->processFrame(captured, settings));
	EyeOutput output;
	ASSERT_TRUE(outputQueue->pop(&output, 10));
	ASSERT_EQ(output.diagnosticImage.size(), Size(80, 30));
}

TEST_F(EyeProcessorTest, BrightPupilRegionIsReportedAsBlink) {
	config["EyeTrack"]["EyeProcessor"]["blinkWarmupFrames"] = 0;
	EyeSettings settings = makeBlobOnlySettings();
	settings.blinkDetection = true;
	build(settings, mockFactory(fixedResult(Point2d(50.0, 50.0), Size(100, 100))));

	CapturedFrame open = makeCaptured(centeredDisk(), 1);
	ASSERT_TRUE(processor->processFrame(open, settings));
	CapturedFrame closed = makeCaptured(Mat(100, 100, CV_8UC3, Scalar(200, 200, 200)), 2);
	ASSERT_TRUE(processor->processFrame(closed, settings));

	EyeOutput output;
	ASSERT_TRUE(outputQueue->pop(&output, 10));
	ASSERT_FALSE(output.record.blink);
	ASSERT_TRUE(outputQueue->pop(&output, 10));
	ASSERT_TRUE(output.record.blink);
	ASSERT_EQ(output.record.origin, GAZE_ORIGIN_BLOB);
	ASSERT_EQ(output.record.x, 0.0);
	ASSERT_EQ(output.record.y, 0.0);
}

TEST_F(EyeProcessorTest, RequestsApplyAtTheNextFrame) {
	EyeSettings settings = makeBlobOnlySettings();
	settings.blinkDetection = false;
	settings.calibrationFrames = 3;
	build(settings, mockFactory(fixedResult(Point2d(40.0, 60.0), Size(100, 100))));
	ASSERT_TRUE(processor->getCalibrator()->getIsCalibrating());

	processor->requestRecenter();
	ASSERT_FALSE(processor->getCalibrator()->getHasCenter());
	CapturedFrame captured = makeCaptured(centeredDisk(), 1);
	ASSERT_TRUE(processor->processFrame(captured, settings));
	ASSERT_TRUE(processor->getCalibrator()->getHasCenter());
	ASSERT_EQ(processor->getCalibrator()->getCenter(), Point2d(40.0, 60.0));

	processor->requestCalibrationRestart();
	captured = makeCaptured(centeredDisk(), 2);
	ASSERT_TRUE(processor->processFrame(captured, settings));
	ASSERT_TRUE(processor->getCalibrator()->getIsCalibrating());
	ASSERT_FALSE(processor->getCalibrator()->getHasCenter());
}

TEST_F(EyeProcessorTest, DisabledAlgorithmIsTornDownBetweenFrames) {
	EyeSettings settings = makeBlobOnlySettings();
	settings.algorithms[DETECTOR_EDGE].enabled = true;
	settings.algorithms[DETECTOR_EDGE].priority = 2;
	build(settings);
	CapturedFrame captured = makeCaptured(centeredDisk(), 1);
	ASSERT_TRUE(processor->processFrame(captured, settings));
	ASSERT_TRUE(processor->getDetectorManager()->hasEngine(DETECTOR_EDGE));

	settingsCell->setAlgorithmEnabled(DETECTOR_EDGE, false);
	settings = settingsCell->snapshot();
	captured = makeCaptured(centeredDisk(), 2);
	ASSERT_TRUE(processor->processFrame(captured, settings));
	ASSERT_FALSE(processor->getDetectorManager()->hasEngine(DETECTOR_EDGE));
	ASSERT_TRUE(processor->getDetectorManager()->hasEngine(DETECTOR_BLOB));
	ASSERT_EQ(processor->getDetectorManager()->getConstructionCount(DETECTOR_BLOB), 1);
	ASSERT_FALSE(processor->getScheduler()->getSlotTable().occupied[1]);
}

TEST_F(EyeProcessorTest, MalformedSmoothingFallsBackToDefaults) {
	EyeSettings settings = makeBlobOnlySettings();
	settings.smoothingMinCutoff = "not a number";
	settings.smoothingSpeedCoefficient = -2.0;
	build(settings);
	ASSERT_DOUBLE_EQ(processor->getSmoothingFilter()->getMinCutoff(), 0.0004);
	ASSERT_DOUBLE_EQ(processor->getSmoothingFilter()->getSpeedCoefficient(), 0.9);

	settings.smoothingMinCutoff = "0.5";
	settings.smoothingSpeedCoefficient = 0.1;
	CapturedFrame captured = makeCaptured(centeredDisk(), 1);
	ASSERT_TRUE(processor->processFrame(captured, settings));
	ASSERT_DOUBLE_EQ(processor->getSmoothingFilter()->getMinCutoff(), 0.5);
	ASSERT_DOUBLE_EQ(processor->getSmoothingFilter()->getSpeedCoefficient(), 0.1);
}

} //namespace
