#pragma once

#include <string>
#include <vector>

#include "common/models.hpp"
#include "tracker/record_store.hpp"

namespace worklog {

// Builds a record from user-entered "YYYY-MM-DD HH:MM:SS" texts.
// Throws InvalidFormat when a text does not parse and EndBeforeStart when
// the end lies strictly before the start. Elapsed is the plain calendar
// difference between the two wall-clock readings.
Record validateAndBuild(const std::string &startText,
                        const std::string &endText,
                        const std::string &comment);

// Replaces snapshot[index] and persists the whole snapshot.
void applyEdit(RecordStore &store,
               std::vector<Record> &snapshot,
               int index,
               const Record &newRecord);

// Stored ISO text to the editable "YYYY-MM-DD HH:MM:SS" form. Unparseable
// input is returned unchanged.
std::string toDisplay(const std::string &isoText);

std::string describe(const Record &record);

} // namespace worklog
