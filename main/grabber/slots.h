#ifndef HC_SLOTS_H
#define HC_SLOTS_H

#include <stdint.h>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace grabber {
	// Bookkeeping for the refresh / retry timers. Each timer carries a slot number as its id; slot numbers
	// are never reused, so an event for a slot that was cancelled (or already handled) simply finds nothing.
	//
	// Ticks wrap; comparisons are done on the difference.
	template<typename Handle>
	struct SlotTable {
		struct Slot {
			std::string instance_id;
			int attempt = 0;
			bool periodic = false;
			Handle timer{};
			uint32_t due = 0; // one-shot only, tick the timer should have fired at
		};

		// Slot number for the next timer, before it is created
		uintptr_t reserve() {
			return next_slot++;
		}

		void insert(uintptr_t slot, Slot s) {
			slots[slot] = std::move(s);
		}

		// Turns a fired slot back into what it was for. One-shot slots are removed (the caller owns deleting
		// out.timer). False if it was cancelled or handled in the meantime.
		bool take(uintptr_t slot, Slot& out) {
			auto it = slots.find(slot);
			if (it == slots.end()) return false;

			out = it->second;
			if (!out.periodic) slots.erase(it);
			return true;
		}

		// Removes every slot for instance_id, returning their timers
		std::vector<Handle> cancel(const std::string& instance_id) {
			std::vector<Handle> timers;
			for (auto it = slots.begin(); it != slots.end();) {
				if (it->second.instance_id == instance_id) {
					timers.push_back(it->second.timer);
					it = slots.erase(it);
				}
				else ++it;
			}
			return timers;
		}

		// One-shot slots still waiting grace ticks after they were due, meaning their event never arrived.
		std::vector<uintptr_t> overdue(uint32_t now, uint32_t grace) const {
			std::vector<uintptr_t> late;
			for (const auto& s : slots) {
				if (s.second.periodic) continue;
				if ((int32_t)(now - (s.second.due + grace)) >= 0) late.push_back(s.first);
			}
			return late;
		}

		size_t size() const {return slots.size();}

	private:
		uintptr_t next_slot = 1;
		std::map<uintptr_t, Slot> slots;
	};
}

#endif
