#pragma once

#include "Logger.hpp"
#include "Utilities.hpp"

#include "SDL.h"
#include "opencv2/core.hpp"

#include <list>
#include <string>

using namespace std;

namespace EyeTrack {

class CapturedFrame {
public:
	cv::Mat frame;
	FrameNumber frameNumber;
	double fps;
};

// Bounded handoff between the frame source and the eye processor. The
// consumer raises the capture-requested flag when it runs dry; the producer
// waits on that flag to pace itself.
class CaptureQueue {
public:
	CaptureQueue(json config, string myName);
	~CaptureQueue();
	bool push(CapturedFrame capturedFrame, Uint32 timeoutMilliseconds);
	bool pop(CapturedFrame *capturedFrame, Uint32 timeoutMilliseconds);
	bool isEmpty(void);
	size_t getSize(void);
	size_t getCapacity(void);
	void setCaptureRequested(void);
	bool waitForCaptureRequest(Uint32 timeoutMilliseconds);
private:
	string name;
	size_t capacity;
	list<CapturedFrame> frames;
	bool captureRequested;

	Logger *logger;
	SDL_mutex *myMutex;
	SDL_cond *notEmptyCond, *notFullCond, *captureRequestedCond;
};

}; //namespace EyeTrack
