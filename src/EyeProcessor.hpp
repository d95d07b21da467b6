#pragma once

#include "AlgorithmScheduler.hpp"
#include "BlinkClassifier.hpp"
#include "CaptureQueue.hpp"
#include "DetectorManager.hpp"
#include "EyeSettings.hpp"
#include "FramePreprocessor.hpp"
#include "GazeCalibrator.hpp"
#include "Logger.hpp"
#include "Metrics.hpp"
#include "OneEuroFilter.hpp"
#include "OutputQueue.hpp"
#include "OutputSink.hpp"
#include "Status.hpp"
#include "Utilities.hpp"

#include "SDL.h"

#include <string>

using namespace std;

namespace EyeTrack {

// Per-eye worker. Pulls frames from the capture queue, crops and rotates them,
// lets the scheduler pick one detector, post-processes the result and
// publishes a diagnostic image plus gaze record.
class EyeProcessor {
public:
	EyeProcessor(json config, Status *myStatus, string myEyeName, SettingsCell *mySettings, CaptureQueue *myCaptureQueue, OutputQueue *myOutputQueue, DetectorEngineFactory myFactory = nullptr);
	~EyeProcessor() noexcept(false);
	void startThread(void);
	bool loopIteration(void);
	bool processFrame(CapturedFrame &captured, const EyeSettings &settings);
	void requestCalibrationRestart(void);
	void requestRecenter(void);
	DetectorManager *getDetectorManager(void);
	AlgorithmScheduler *getScheduler(void);
	GazeCalibrator *getCalibrator(void);
	OneEuroFilter *getSmoothingFilter(void);
	Metrics *getDetectorMetrics(void);
	Metrics *getTickMetrics(void);
	FrameNumber getFramesPublished(void);
private:
	static int runLoop(void *ptr);
	void applyPendingRequests(const EyeSettings &settings);
	void refreshSlotTable(const EyeSettings &settings);
	void refreshSmoothingFilter(const EyeSettings &settings);
	GazeRecord buildRecord(const DetectorResult &result, DetectorAlgorithm algorithm, const PreprocessedFrame &preprocessed, const EyeSettings &settings, double elapsedSeconds);
	double getElapsedSeconds(double fps);

	string eyeName;
	Status *status;
	SettingsCell *settingsCell;
	CaptureQueue *captureQueue;
	OutputQueue *outputQueue;

	Uint32 frameWaitMilliseconds, roiWaitMilliseconds;

	FramePreprocessor *preprocessor;
	DetectorManager *detectorManager;
	AlgorithmScheduler *scheduler;
	BlinkClassifier *blinkClassifier;
	GazeCalibrator *calibrator;
	OneEuroFilter *smoothingFilter;
	OutputSink *outputSink;
	Metrics *detectorMetrics, *tickMetrics;

	AlgorithmSetting lastAlgorithmSettings[DETECTOR_ALGORITHM_COUNT];
	bool haveAlgorithmSettings;
	json lastSmoothingMinCutoff, lastSmoothingSpeedCoefficient;
	bool wasWaitingForROI;
	Uint32 lastTickTime;
	FrameNumber framesPublished;

	bool calibrationRestartRequested, recenterRequested;

	Logger *logger;
	SDL_mutex *myMutex;
	SDL_Thread *myThread;
};

}; //namespace EyeTrack
