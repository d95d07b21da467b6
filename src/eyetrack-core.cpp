#include "Logger.hpp"
#include "Status.hpp"
#include "Utilities.hpp"
#include "EyeSettings.hpp"
#include "CaptureQueue.hpp"
#include "OutputQueue.hpp"
#include "EyeProcessor.hpp"
#include "VideoCaptureSource.hpp"
#include "Metrics.hpp"

#include "opencv2/core/utility.hpp"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>

#ifndef EYETRACK_VERSION
#define EYETRACK_VERSION "unknown"
#endif

#define EYETRACK_DRAIN_GRACE_POLLS 5
#define EYETRACK_OUTPUT_POLL_MILLISECONDS 100

using namespace std;
using namespace cv;
using namespace EyeTrack;

string configFile;
string inVideo;
string eye;
string outGazeData;
string outLogFile;
string outLogColors;
string outLogColorsString = "";
string roiString;

int verbosity = 0, logSeverityFilter = LOG_SEVERITY_FILTERDEFAULT;

json config = NULL;

Status *status = NULL;
Logger *logger = NULL;
SettingsCell *settingsCell = NULL;
CaptureQueue *captureQueue = NULL;
OutputQueue *outputQueue = NULL;
EyeProcessor *eyeProcessor = NULL;
VideoCaptureSource *videoCaptureSource = NULL;
Metrics *outputMetrics = NULL;
FILE *gazeDataFile = NULL;

int eyetrack(int argc, char *argv[]);
void parseConfigFile(void);
void applyRegionOfInterest(void);
void writeGazeData(const EyeOutput &output);

int main(int argc, char *argv[]) {
	try {
		return eyetrack(argc, argv);
	} catch(exception &e) {
		Logger::slog("Main", LOG_SEVERITY_CRIT, "Uncaught exception in parent thread: %s", e.what());
	}
	return 1;
}

int eyetrack(int argc, char *argv[]) {
	//Command line options. NOTE: Remember to update the documentation when making changes here!
	CommandLineParser parser(argc, argv,
		"{help h usage ?||Display command line usage documentation.}"
		"{configFile||Configuration file. (Indicate the full or relative path to your 'eyetrack-config.json' file. Omit to search common locations.)}"
		"{inVideo||Video file or camera device index to open.}"
		"{eye|left|Which eye this process tracks. Either \"left\" or \"right\". Selects the settings block in the configuration file.}"
		"{roi||Region of interest as \"x,y,width,height\" in source frame pixels. Overrides the configuration file. If neither sets one, the full frame is used.}"
		"{outGazeData||Output gaze data file, one JSON object per line. If \"-\", gaze data will be written to STDOUT.}"
		"{outLogFile||If specified, log messages will be written to this file. If \"-\" or not specified, log messages will be written to STDERR.}"
		"{outLogColors||If true, log colorization will be forced on. If false, log colorization will be forced off. If \"auto\" or not specified, log colorization will auto-detect.}"
		"{version||Emit the version string to STDOUT and exit.}"
		"{verbosity verbose v||Adjust the log level filter. Indicate a positive number to increase the verbosity, a negative number to decrease the verbosity, or specify with no integer to increase the verbosity to a moderate degree.)}"
		);
	parser.about("eyetrack-core: per-eye pupil tracking pipeline. [" EYETRACK_VERSION "]");
	if(argc <= 1) {
		parser.printMessage();
		return 0;
	}
	if(parser.has("version") && parser.get<bool>("version")) {
		fprintf(stdout, "%s\n", EYETRACK_VERSION);
		return 0;
	}
	if(parser.has("help") && parser.get<bool>("help")) {
		parser.printMessage();
		return 1;
	}
	if(parser.has("verbosity")) {
		string verbosityString = parser.get<string>("verbosity");
		if(verbosityString.length() == 0 || verbosityString == "true") {
			verbosity = 2;
		} else {
			verbosity = parser.get<int>("verbosity");
		}
		logSeverityFilter = (int)LOG_SEVERITY_FILTERDEFAULT + verbosity;
		if(logSeverityFilter < (int)LOG_SEVERITY_MIN) {
			logSeverityFilter = LOG_SEVERITY_MIN;
		} else if(logSeverityFilter > (int)LOG_SEVERITY_MAX) {
			logSeverityFilter = LOG_SEVERITY_MAX;
		}
		Logger::setLoggingFilter((LogMessageSeverity)logSeverityFilter);
	}
	configFile = parser.get<string>("configFile");
	inVideo = parser.get<string>("inVideo");
	if(inVideo.length() == 0) {
		throw invalid_argument("--inVideo is a required argument, but is blank or not specified!");
	}
	eye = parser.get<string>("eye");
	if(eye != "left" && eye != "right") {
		throw invalid_argument("--eye must be either \"left\" or \"right\"!");
	}
	roiString = parser.get<string>("roi");
	outGazeData = parser.get<string>("outGazeData");
	outLogFile = parser.get<string>("outLogFile");
	outLogColors = parser.get<string>("outLogColors");

	if(!parser.check()) {
		parser.printErrors();
		parser.printMessage();
		return 1;
	}

	if(outLogFile.length() == 0 || outLogFile == "-") {
		outLogFile = "-";
		Logger::setLoggingTarget(stderr);
	} else {
		if(Utilities::fileExists(outLogFile)) {
			throw invalid_argument("Refusing to overwrite outLogFile. Specified file already exists!");
		}
		Logger::setLoggingTarget(outLogFile);
	}
	if(outLogColors.length() == 0 || outLogColors == "auto") {
		Logger::setLoggingColorMode(LOG_COLORS_AUTO);
		outLogColorsString = "AUTO";
	} else {
		if(parser.get<bool>("outLogColors")) {
			Logger::setLoggingColorMode(LOG_COLORS_ON);
			outLogColorsString = "ON";
		} else {
			Logger::setLoggingColorMode(LOG_COLORS_OFF);
			outLogColorsString = "OFF";
		}
	}

	logger = new Logger("EyeTrack");
	logger->notice("Starting up...");
	logger->info("Log output is being sent to: %s", outLogFile == "-" ? "STDERR" : outLogFile.c_str());
	logger->info("Log filter is set to: %s", Logger::getSeverityString(Logger::getLoggingFilter()).c_str());
	logger->info("Log colorization mode is: %s", outLogColorsString.c_str());

	if(outGazeData.length() > 0) {
		if(outGazeData == "-") {
			gazeDataFile = stdout;
		} else {
			if(Utilities::fileExists(outGazeData)) {
				throw invalid_argument("Refusing to overwrite outGazeData. Specified file already exists!");
			}
			if((gazeDataFile = fopen(outGazeData.c_str(), "w")) == NULL) {
				throw runtime_error("Failed opening outGazeData for writing!");
			}
		}
	}

	//Initialize configuration.
	parseConfigFile();

	//Instantiate our classes.
	status = new Status();
	settingsCell = new SettingsCell(EyeSettings::fromJSON(config["EyeTrack"]["Settings"][eye]));
	captureQueue = new CaptureQueue(config, eye);
	outputQueue = new OutputQueue(config, eye);
	outputMetrics = new Metrics(config, "EyeTrack[" + eye + "]", true);
	eyeProcessor = new EyeProcessor(config, status, eye, settingsCell, captureQueue, outputQueue);
	videoCaptureSource = new VideoCaptureSource(config, status, inVideo, captureQueue);
	applyRegionOfInterest();

	eyeProcessor->startThread();
	videoCaptureSource->startThread();

	//Drain outputs until the source runs dry (and the worker has caught up) or something blows up.
	int idlePolls = 0;
	MetricsTick outputTick = outputMetrics->startClock();
	while(status->getIsRunning() && !status->getIsCancelled()) {
		EyeOutput output;
		if(outputQueue->pop(&output, EYETRACK_OUTPUT_POLL_MILLISECONDS)) {
			idlePolls = 0;
			writeGazeData(output);
			outputMetrics->endClock(outputTick);
			outputTick = outputMetrics->startClock();
			continue;
		}
		if(videoCaptureSource->getIsDrained() && captureQueue->isEmpty()) {
			idlePolls++;
			if(idlePolls >= EYETRACK_DRAIN_GRACE_POLLS) {
				logger->info("Video source drained and no more output is coming. Shutting down.");
				status->requestCancellation();
			}
		}
	}
	status->requestCancellation();
	status->setIsRunning(false);
	bool emergency = status->getEmergency();

	//Cleanup
	logger->notice("Cleaning up...");
	logger->info("Published " EYETRACK_FRAMENUMBER_FORMAT " of " EYETRACK_FRAMENUMBER_FORMAT " frames.", eyeProcessor->getFramesPublished(), videoCaptureSource->getFramesDelivered());
	logger->info("%s", eyeProcessor->getTickMetrics()->describe().c_str());
	logger->info("%s", eyeProcessor->getDetectorMetrics()->describe().c_str());
	logger->info("%s", outputMetrics->describe().c_str());
	EyeTrack_CarefullyDelete(logger, status, videoCaptureSource);
	EyeTrack_CarefullyDelete(logger, status, eyeProcessor);
	EyeTrack_CarefullyDelete(logger, status, outputMetrics);
	EyeTrack_CarefullyDelete(logger, status, outputQueue);
	EyeTrack_CarefullyDelete(logger, status, captureQueue);
	EyeTrack_CarefullyDelete(logger, status, settingsCell);
	if(gazeDataFile != NULL && gazeDataFile != stdout) {
		fclose(gazeDataFile);
	}
	gazeDataFile = NULL;

	logger->info("Goodbye!");
	EyeTrack_CarefullyDelete_NoStatus(logger, status);
	delete logger;
	return emergency ? 1 : 0;
}

void parseConfigFile(void) {
	if(configFile.length() < 1) {
		configFile = Utilities::fileValidPathOrDie("eyetrack-config.json", true);
	} else {
		configFile = Utilities::fileValidPathOrDie(configFile);
	}
	try {
		logger->info("Opening and parsing config file: \"%s\"", configFile.c_str());
		std::ifstream fileStream(configFile);
		if(fileStream.fail()) {
			throw invalid_argument("Specified config file failed to open.");
		}
		std::stringstream ssBuffer;
		ssBuffer << fileStream.rdbuf();
		config = json::parse(ssBuffer.str());
	} catch(exception &e) {
		logger->err("Failed to parse configuration file \"%s\". Got exception: %s", configFile.c_str(), e.what());
		throw;
	}
}

void applyRegionOfInterest(void) {
	Rect roi;
	if(roiString.length() > 0) {
		if(!EyeSettings::parseROI(roiString, &roi)) {
			throw invalid_argument("--roi must look like \"x,y,width,height\" with a positive width and height!");
		}
		settingsCell->setROI(roi);
		logger->info("Region of interest set from the command line to <%d, %d, %d, %d>", roi.x, roi.y, roi.width, roi.height);
		return;
	}
	if(settingsCell->snapshot().hasROI()) {
		return;
	}
	Size frameSize = videoCaptureSource->getFrameSize();
	if(frameSize.width > 0 && frameSize.height > 0) {
		roi = Rect(0, 0, frameSize.width, frameSize.height);
		settingsCell->setROI(roi);
		logger->notice("No region of interest configured. Using the full %dx%d frame. Set one with --roi=x,y,width,height or EyeTrack.Settings.%s.roi in the configuration file.", frameSize.width, frameSize.height, eye.c_str());
		return;
	}
	logger->warning("No region of interest configured and the source did not report a frame size. Nothing will be tracked until one is set with --roi=x,y,width,height or EyeTrack.Settings.%s.roi in the configuration file.", eye.c_str());
}

void writeGazeData(const EyeOutput &output) {
	if(gazeDataFile == NULL) {
		return;
	}
	json line;
	line["eye"] = eye;
	line["frameNumber"] = output.frameNumber;
	line["gaze"] = output.record.toJSON();
	string serialized = line.dump();
	fprintf(gazeDataFile, "%s\n", serialized.c_str());
	fflush(gazeDataFile);
}
