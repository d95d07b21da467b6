#include "EyeProcessor.hpp"

#include <utility>

using namespace std;
using namespace cv;

namespace EyeTrack {

EyeProcessor::EyeProcessor(json config, Status *myStatus, string myEyeName, SettingsCell *mySettings, CaptureQueue *myCaptureQueue, OutputQueue *myOutputQueue, DetectorEngineFactory myFactory) {
	eyeName = myEyeName;
	status = myStatus;
	if(status == NULL) {
		throw invalid_argument("status cannot be NULL");
	}
	settingsCell = mySettings;
	if(settingsCell == NULL) {
		throw invalid_argument("settingsCell cannot be NULL");
	}
	captureQueue = myCaptureQueue;
	if(captureQueue == NULL) {
		throw invalid_argument("captureQueue cannot be NULL");
	}
	outputQueue = myOutputQueue;
	if(outputQueue == NULL) {
		throw invalid_argument("outputQueue cannot be NULL");
	}
	myThread = NULL;

	int frameWait = config["EyeTrack"]["EyeProcessor"]["frameWaitMilliseconds"];
	if(frameWait < 1) {
		throw invalid_argument("frameWaitMilliseconds must be at least one");
	}
	frameWaitMilliseconds = (Uint32)frameWait;
	int roiWait = config["EyeTrack"]["EyeProcessor"]["roiWaitMilliseconds"];
	if(roiWait < 1) {
		throw invalid_argument("roiWaitMilliseconds must be at least one");
	}
	roiWaitMilliseconds = (Uint32)roiWait;
	double blinkThreshold = config["EyeTrack"]["EyeProcessor"]["blinkThreshold"];
	int blinkWarmupFrames = config["EyeTrack"]["EyeProcessor"]["blinkWarmupFrames"];

	logger = new Logger("EyeProcessor<" + eyeName + ">");
	if((myMutex = SDL_CreateMutex()) == NULL) {
		throw runtime_error("Failed creating mutex!");
	}

	preprocessor = new FramePreprocessor(eyeName);
	detectorManager = new DetectorManager(eyeName, myFactory);
	scheduler = new AlgorithmScheduler(eyeName);
	blinkClassifier = new BlinkClassifier(eyeName, blinkThreshold, blinkWarmupFrames);
	calibrator = new GazeCalibrator(eyeName);
	outputSink = new OutputSink(eyeName, outputQueue);
	detectorMetrics = new Metrics(config, eyeName + ".Detector");
	tickMetrics = new Metrics(config, eyeName + ".Tick", true);

	EyeSettings settings = settingsCell->snapshot();
	smoothingFilter = OneEuroFilter::fromSettings(settings.smoothingMinCutoff, settings.smoothingSpeedCoefficient, logger);
	lastSmoothingMinCutoff = settings.smoothingMinCutoff;
	lastSmoothingSpeedCoefficient = settings.smoothingSpeedCoefficient;
	if(settings.calibrationFrames > 0) {
		calibrator->restartCalibration(settings.calibrationFrames);
	}

	haveAlgorithmSettings = false;
	wasWaitingForROI = false;
	lastTickTime = 0;
	framesPublished = 0;
	calibrationRestartRequested = false;
	recenterRequested = false;

	logger->debug1("EyeProcessor object constructed and ready to go!");
}

EyeProcessor::~EyeProcessor() noexcept(false) {
	logger->debug1("EyeProcessor object destructing...");
	if(myThread != NULL) {
		if(!status->getIsCancelled()) {
			logger->crit("Destructing while the worker is still running and nobody asked it to stop! Requesting cancellation.");
			status->requestCancellation();
		}
		SDL_WaitThread(myThread, NULL);
		myThread = NULL;
	}
	EyeTrack_CarefullyDelete(logger, status, tickMetrics);
	EyeTrack_CarefullyDelete(logger, status, detectorMetrics);
	EyeTrack_CarefullyDelete(logger, status, outputSink);
	EyeTrack_CarefullyDelete(logger, status, smoothingFilter);
	EyeTrack_CarefullyDelete(logger, status, calibrator);
	EyeTrack_CarefullyDelete(logger, status, blinkClassifier);
	EyeTrack_CarefullyDelete(logger, status, scheduler);
	EyeTrack_CarefullyDelete(logger, status, detectorManager);
	EyeTrack_CarefullyDelete(logger, status, preprocessor);
	SDL_DestroyMutex(myMutex);
	delete logger;
}

void EyeProcessor::startThread(void) {
	if(myThread != NULL) {
		throw logic_error("EyeProcessor thread is already running");
	}
	string threadName = "EyeProcessor<" + eyeName + ">";
	if((myThread = SDL_CreateThread(runLoop, threadName.c_str(), (void *)this)) == NULL) {
		throw runtime_error("Failed starting thread!");
	}
}

int EyeProcessor::runLoop(void *ptr) {
	EyeProcessor *self = (EyeProcessor *)ptr;
	try {
		self->logger->debug1("Eye processing thread alive!");
		while(self->loopIteration()) {
			//Nothing to do here.
		}
		self->logger->info("Exiting tracking thread.");
		return 0;
	} catch(exception &e) {
		self->logger->emerg("Uncaught exception in eye processing thread: %s", e.what());
		self->status->setEmergency();
	}
	return 1;
}

// One pass of the worker loop. Returns false once the worker should exit.
bool EyeProcessor::loopIteration(void) {
	if(status->getIsCancelled()) {
		return false;
	}

	EyeSettings settings = settingsCell->snapshot();
	if(!settings.hasROI()) {
		if(!wasWaitingForROI) {
			logger->notice("Waiting for a region of interest to be configured. Set one with --roi=x,y,width,height or in the eye's settings block.");
			wasWaitingForROI = true;
		}
		return !status->waitForCancellation(roiWaitMilliseconds);
	}
	wasWaitingForROI = false;

	if(captureQueue->isEmpty()) {
		captureQueue->setCaptureRequested();
	}
	CapturedFrame captured;
	if(!captureQueue->pop(&captured, frameWaitMilliseconds)) {
		logger->debug4("No frame within %u ms.", frameWaitMilliseconds);
		return true;
	}

	MetricsTick tick = tickMetrics->startClock();
	processFrame(captured, settings);
	tickMetrics->endClock(tick);
	return true;
}

bool EyeProcessor::processFrame(CapturedFrame &captured, const EyeSettings &settings) {
	applyPendingRequests(settings);
	refreshSmoothingFilter(settings);

	Mat frame = std::move(captured.frame);
	PreprocessedFrame preprocessed;
	if(!preprocessor->process(frame, settings.getROI(), settings.rotationAngle, &preprocessed)) {
		return false;
	}

	DetectorResult result;
	SchedulerTick schedulerTick;
	try {
		detectorManager->reconcile(settings, preprocessed.gray.size());
		refreshSlotTable(settings);
		schedulerTick = scheduler->tick([&](DetectorAlgorithm algorithm) {
			DetectorEngine *engine = detectorManager->getEngine(algorithm);
			if(engine == NULL) {
				throw logic_error("Scheduled an algorithm that has no engine");
			}
			MetricsTick metricsTick = detectorMetrics->startClock();
			result = engine->run(preprocessed.gray);
			detectorMetrics->endClock(metricsTick);
			return result.isValidSample() ? DETECTOR_OUTCOME_SUCCESS : DETECTOR_OUTCOME_FAILURE;
		});
	} catch(exception &e) {
		logger->err("Detection failed on frame " EYETRACK_FRAMENUMBER_FORMAT ". Skipping this frame: %s", captured.frameNumber, e.what());
		return false;
	}
	if(!schedulerTick.invoked) {
		return false;
	}

	Mat workingGray = preprocessed.gray;
	if(!result.replacementGray.empty()) {
		workingGray = result.replacementGray;
	}

	//Calibration, smoothing and blink state only advance for frames that will actually be published.
	Mat composed;
	if(!outputSink->compose(workingGray, result.diagnosticFrame, captured.frameNumber, &composed)) {
		return false;
	}

	double elapsedSeconds = getElapsedSeconds(captured.fps);
	GazeRecord record = buildRecord(result, schedulerTick.algorithm, preprocessed, settings, elapsedSeconds);
	logger->debug3("Frame " EYETRACK_FRAMENUMBER_FORMAT ": %s <%.03lf, %.03lf> blink %s", captured.frameNumber, GazeRecord::getOriginName(record.origin).c_str(), record.x, record.y, record.blink ? "true" : "false");

	outputSink->publish(composed, record, captured.frameNumber);
	preprocessor->acceptFrame(preprocessed, settings.rotationAngle);
	framesPublished++;
	return true;
}

GazeRecord EyeProcessor::buildRecord(const DetectorResult &result, DetectorAlgorithm algorithm, const PreprocessedFrame &preprocessed, const EyeSettings &settings, double elapsedSeconds) {
	if(!result.isValidSample()) {
		return GazeRecord(GAZE_ORIGIN_FAILURE, 0.0, 0.0, false);
	}
	GazeOrigin origin = GazeRecord::originForAlgorithm(algorithm);
	if(settings.blinkDetection && blinkClassifier->classify(preprocessed.cleanGray, result.center)) {
		return GazeRecord(origin, 0.0, 0.0, true);
	}
	Point2d calibrated = calibrator->normalize(result.center);
	Point2d smoothed = smoothingFilter->filter(calibrated, elapsedSeconds);
	return GazeRecord(origin, smoothed.x, smoothed.y, false);
}

double EyeProcessor::getElapsedSeconds(double fps) {
	Uint32 now = SDL_GetTicks();
	Uint32 previous = lastTickTime;
	lastTickTime = now;
	if(fps > 0.0) {
		return 1.0 / fps;
	}
	if(previous == 0 || now <= previous) {
		return 0.001;
	}
	return (double)(now - previous) / 1000.0;
}

void EyeProcessor::applyPendingRequests(const EyeSettings &settings) {
	EyeTrack_MutexLock(myMutex);
	bool restart = calibrationRestartRequested;
	bool recenter = recenterRequested;
	calibrationRestartRequested = false;
	recenterRequested = false;
	EyeTrack_MutexUnlock(myMutex);

	if(restart) {
		calibrator->restartCalibration(settings.calibrationFrames);
		smoothingFilter->reset();
	}
	if(recenter) {
		calibrator->recenter();
	}
}

void EyeProcessor::refreshSlotTable(const EyeSettings &settings) {
	bool changed = !haveAlgorithmSettings;
	for(unsigned int i = 0; i < DETECTOR_ALGORITHM_COUNT && !changed; i++) {
		if(settings.algorithms[i].enabled != lastAlgorithmSettings[i].enabled || settings.algorithms[i].priority != lastAlgorithmSettings[i].priority) {
			changed = true;
		}
	}
	if(!changed) {
		return;
	}
	for(unsigned int i = 0; i < DETECTOR_ALGORITHM_COUNT; i++) {
		lastAlgorithmSettings[i] = settings.algorithms[i];
	}
	haveAlgorithmSettings = true;

	SlotTable table = AlgorithmScheduler::buildSlotTable(settings, logger);
	scheduler->setSlotTable(table);
	for(int slot = 0; slot < SCHEDULER_SLOT_COUNT; slot++) {
		logger->debug1("Priority %d: %s", slot + DETECTOR_PRIORITY_MIN, table.occupied[slot] ? getDetectorAlgorithmName(table.algorithms[slot]).c_str() : "(empty)");
	}
}

void EyeProcessor::refreshSmoothingFilter(const EyeSettings &settings) {
	if(settings.smoothingMinCutoff == lastSmoothingMinCutoff && settings.smoothingSpeedCoefficient == lastSmoothingSpeedCoefficient) {
		return;
	}
	lastSmoothingMinCutoff = settings.smoothingMinCutoff;
	lastSmoothingSpeedCoefficient = settings.smoothingSpeedCoefficient;
	OneEuroFilter *replacement = OneEuroFilter::fromSettings(settings.smoothingMinCutoff, settings.smoothingSpeedCoefficient, logger);
	delete smoothingFilter;
	smoothingFilter = replacement;
	logger->debug2("Smoothing filter rebuilt with minCutoff %.06lf, speedCoefficient %.03lf.", smoothingFilter->getMinCutoff(), smoothingFilter->getSpeedCoefficient());
}

void EyeProcessor::requestCalibrationRestart(void) {
	EyeTrack_MutexLock(myMutex);
	calibrationRestartRequested = true;
	EyeTrack_MutexUnlock(myMutex);
}

void EyeProcessor::requestRecenter(void) {
	EyeTrack_MutexLock(myMutex);
	recenterRequested = true;
	EyeTrack_MutexUnlock(myMutex);
}

DetectorManager *EyeProcessor::getDetectorManager(void) {
	return detectorManager;
}

AlgorithmScheduler *EyeProcessor::getScheduler(void) {
	return scheduler;
}

GazeCalibrator *EyeProcessor::getCalibrator(void) {
	return calibrator;
}

OneEuroFilter *EyeProcessor::getSmoothingFilter(void) {
	return smoothingFilter;
}

Metrics *EyeProcessor::getDetectorMetrics(void) {
	return detectorMetrics;
}

Metrics *EyeProcessor::getTickMetrics(void) {
	return tickMetrics;
}

FrameNumber EyeProcessor::getFramesPublished(void) {
	return framesPublished;
}

} //namespace EyeTrack
