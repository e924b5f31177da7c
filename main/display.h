#ifndef HC_DISPLAY_H
#define HC_DISPLAY_H

#include <stdio.h>
#include <string>
#include "grabber/forecast.h"

// Link to the rendering layer: JSON lines on stdin / stdout.
namespace display {
	struct Link : forecast::Outbox {
		explicit Link(FILE * out) : out(out) {}

		void deliver(const std::string& instance_id, const payload::Payload& data) override;
		void deliver_error(const std::string& instance_id, const char * error) override;

		// Reads inbound messages until stdin closes, forwarding them to the grabber.
		void run(int in_fd);

	private:
		void write_line(const std::string& line);
		void handle_line(const char * line);

		FILE * out;
	};

	extern Link link;
}

#endif
