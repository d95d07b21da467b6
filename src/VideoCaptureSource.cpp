#include "VideoCaptureSource.hpp"

#include <cctype>
#include <cstdlib>
#include <utility>

using namespace std;
using namespace cv;

namespace EyeTrack {

VideoCaptureSource::VideoCaptureSource(json config, Status *myStatus, string mySource, CaptureQueue *myCaptureQueue) {
	status = myStatus;
	if(status == NULL) {
		throw invalid_argument("status cannot be NULL");
	}
	source = mySource;
	if(source.length() == 0) {
		throw invalid_argument("source cannot be blank");
	}
	captureQueue = myCaptureQueue;
	if(captureQueue == NULL) {
		throw invalid_argument("captureQueue cannot be NULL");
	}
	int requestWait = config["EyeTrack"]["CaptureQueue"]["requestWaitMilliseconds"];
	if(requestWait < 1) {
		throw invalid_argument("requestWaitMilliseconds must be at least one");
	}
	requestWaitMilliseconds = (Uint32)requestWait;
	myThread = NULL;
	nextFrameNumber = 0;
	drained = false;

	logger = new Logger("VideoCaptureSource");
	if((myMutex = SDL_CreateMutex()) == NULL) {
		throw runtime_error("Failed creating mutex!");
	}

	bool isDevice = true;
	for(char c : source) {
		if(!isdigit((unsigned char)c)) {
			isDevice = false;
			break;
		}
	}
	if(isDevice) {
		int device = atoi(source.c_str());
		logger->info("Opening capture device %d", device);
		capture.open(device);
	} else {
		logger->info("Opening video \"%s\"", source.c_str());
		capture.open(source);
	}
	if(!capture.isOpened()) {
		throw runtime_error("Failed opening video source!");
	}
	fps = capture.get(CAP_PROP_FPS);
	if(!(fps > 0.0)) {
		fps = 0.0;
	}
	frameSize = Size((int)capture.get(CAP_PROP_FRAME_WIDTH), (int)capture.get(CAP_PROP_FRAME_HEIGHT));
	logger->debug1("VideoCaptureSource object constructed. Source reports %dx%d at %.02lf FPS.", frameSize.width, frameSize.height, fps);
}

VideoCaptureSource::~VideoCaptureSource() noexcept(false) {
	logger->debug1("VideoCaptureSource object destructing...");
	if(myThread != NULL) {
		if(!status->getIsCancelled()) {
			logger->crit("Destructing while the capture thread is still running! Requesting cancellation.");
			status->requestCancellation();
		}
		SDL_WaitThread(myThread, NULL);
		myThread = NULL;
	}
	capture.release();
	SDL_DestroyMutex(myMutex);
	delete logger;
}

void VideoCaptureSource::startThread(void) {
	if(myThread != NULL) {
		throw logic_error("VideoCaptureSource thread is already running");
	}
	if((myThread = SDL_CreateThread(runLoop, "VideoCapture", (void *)this)) == NULL) {
		throw runtime_error("Failed starting thread!");
	}
}

int VideoCaptureSource::runLoop(void *ptr) {
	VideoCaptureSource *self = (VideoCaptureSource *)ptr;
	try {
		self->logger->debug1("Capture thread alive!");
		while(!self->status->getIsCancelled()) {
			if(!self->captureQueue->waitForCaptureRequest(self->requestWaitMilliseconds)) {
				continue;
			}
			if(!self->deliverNextFrame()) {
				break;
			}
		}
		self->logger->debug1("Capture thread done.");
		return 0;
	} catch(exception &e) {
		self->logger->emerg("Uncaught exception in capture thread: %s", e.what());
		self->status->setEmergency();
	}
	return 1;
}

bool VideoCaptureSource::deliverNextFrame(void) {
	CapturedFrame captured;
	if(!capture.read(captured.frame) || captured.frame.empty()) {
		logger->notice("Video source has no more frames. Delivered " EYETRACK_FRAMENUMBER_FORMAT " frames.", nextFrameNumber);
		setIsDrained();
		return false;
	}
	captured.frameNumber = nextFrameNumber;
	captured.fps = fps;
	while(!captureQueue->push(captured, requestWaitMilliseconds)) {
		if(status->getIsCancelled()) {
			return false;
		}
	}
	EyeTrack_MutexLock(myMutex);
	nextFrameNumber++;
	EyeTrack_MutexUnlock(myMutex);
	return true;
}

void VideoCaptureSource::setIsDrained(void) {
	EyeTrack_MutexLock(myMutex);
	drained = true;
	EyeTrack_MutexUnlock(myMutex);
}

bool VideoCaptureSource::getIsDrained(void) {
	EyeTrack_MutexLock(myMutex);
	bool status = drained;
	EyeTrack_MutexUnlock(myMutex);
	return status;
}

FrameNumber VideoCaptureSource::getFramesDelivered(void) {
	EyeTrack_MutexLock(myMutex);
	FrameNumber status = nextFrameNumber;
	EyeTrack_MutexUnlock(myMutex);
	return status;
}

// Zero when the backend cannot tell before the first frame is read.
Size VideoCaptureSource::getFrameSize(void) {
	return frameSize;
}

} //namespace EyeTrack
