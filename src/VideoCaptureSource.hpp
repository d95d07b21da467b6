#pragma once

#include "CaptureQueue.hpp"
#include "Logger.hpp"
#include "Status.hpp"
#include "Utilities.hpp"

#include "SDL.h"
#include "opencv2/videoio.hpp"

#include <string>

using namespace std;

namespace EyeTrack {

// Reads frames from a file or camera with cv::VideoCapture and feeds them to
// the capture queue, one frame per capture request.
class VideoCaptureSource {
public:
	VideoCaptureSource(json config, Status *myStatus, string mySource, CaptureQueue *myCaptureQueue);
	~VideoCaptureSource() noexcept(false);
	void startThread(void);
	bool getIsDrained(void);
	FrameNumber getFramesDelivered(void);
	cv::Size getFrameSize(void);
private:
	static int runLoop(void *ptr);
	bool deliverNextFrame(void);
	void setIsDrained(void);

	Status *status;
	string source;
	CaptureQueue *captureQueue;
	Uint32 requestWaitMilliseconds;

	cv::VideoCapture capture;
	double fps;
	cv::Size frameSize;
	FrameNumber nextFrameNumber;
	bool drained;

	Logger *logger;
	SDL_mutex *myMutex;
	SDL_Thread *myThread;
};

}; //namespace EyeTrack
