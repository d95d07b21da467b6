#pragma once

#include "Logger.hpp"
#include "GazeRecord.hpp"
#include "Utilities.hpp"

#include "SDL.h"
#include "opencv2/core.hpp"

#include <list>
#include <string>

using namespace std;

namespace EyeTrack {

class EyeOutput {
public:
	cv::Mat diagnosticImage;
	GazeRecord record;
	FrameNumber frameNumber;
};

// Outgoing channel. Never blocks the producer: when full, the oldest entry
// is discarded.
class OutputQueue {
public:
	OutputQueue(json config, string myName);
	~OutputQueue();
	void push(EyeOutput output);
	bool pop(EyeOutput *output, Uint32 timeoutMilliseconds);
	size_t getSize(void);
	size_t getDroppedCount(void);
private:
	string name;
	size_t capacity;
	size_t droppedCount;
	list<EyeOutput> outputs;

	Logger *logger;
	SDL_mutex *myMutex;
	SDL_cond *myCond;
};

}; //namespace EyeTrack
