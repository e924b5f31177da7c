#ifndef HC_GRAB_H
#define HC_GRAB_H

#include <FreeRTOS.h>
#include "../message.h"

namespace grabber {
	// Create the event queue and the worker task that owns the forecast service.
	bool start();

	// Hand an inbound message to the worker. Safe from any task.
	bool post(const message::Inbound& msg);

	// Instance defaults from the .defaults config block
	message::Defaults defaults();
}

#endif
