#pragma once

#include "Logger.hpp"
#include "Utilities.hpp"

#include "SDL.h"

using namespace std;

namespace EyeTrack {

// Process-wide run state shared by every worker. Cancellation is the only
// signal a worker needs to exit; emergency is raised by a worker that died
// on an uncaught exception so the parent can wind everything down.
class Status {
public:
	Status(void);
	~Status() noexcept(false);
	void setIsRunning(bool newIsRunning);
	bool getIsRunning(void);
	void setEmergency(void);
	bool getEmergency(void);
	void requestCancellation(void);
	bool getIsCancelled(void);
	bool waitForCancellation(Uint32 timeoutMilliseconds);

private:
	bool isRunning;
	bool emergency;
	bool cancelled;

	Logger *logger;
	SDL_mutex *myMutex;
	SDL_cond *myCond;
};

}; //namespace EyeTrack
