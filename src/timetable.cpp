///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "timetable.hpp"
#include <algorithm>
#include <stdexcept>


///////////////////////////
///     ASSIGNMENTS     ///
///////////////////////////
bool ClassAssignment::sameContent(const ClassAssignment& other) const {
    return subjectId == other.subjectId &&
           facultyIds == other.facultyIds &&
           roomId == other.roomId &&
           batchId == other.batchId &&
           day == other.day &&
           slot == other.slot &&
           pinned == other.pinned;
}


///////////////////////////
///        GRID         ///
///////////////////////////
TimetableGrid::TimetableGrid(int numBatches, int numDays, int slotsPerDay)
        : numBatches_(numBatches),
          numDays_(numDays),
          slotsPerDay_(slotsPerDay) {
    if (numBatches < 0 || numDays < 0 || slotsPerDay < 0) {
        throw std::invalid_argument("TimetableGrid dimensions must be non-negative");
    }
    cells_.resize((size_t)numBatches * numDays * slotsPerDay);
}

bool TimetableGrid::inBounds(int batchIndex, int day, int slot) const {
    return batchIndex >= 0 && batchIndex < numBatches_ &&
           day >= 0 && day < numDays_ &&
           slot >= 0 && slot < slotsPerDay_;
}

const ClassAssignment* TimetableGrid::at(int batchIndex, int day, int slot) const {
    if (!inBounds(batchIndex, day, slot)) return nullptr;
    const auto& cell = cells_[cellIndex(batchIndex, day, slot)];
    return cell ? &*cell : nullptr;
}

bool TimetableGrid::put(int batchIndex, const ClassAssignment& assignment) {
    if (!inBounds(batchIndex, assignment.day, assignment.slot)) return false;
    cells_[cellIndex(batchIndex, assignment.day, assignment.slot)] = assignment;
    // Keep the counter ahead of ids that came from elsewhere (pins, baselines).
    if (assignment.id >= nextId_) nextId_ = assignment.id + 1;
    return true;
}

std::optional<ClassAssignment> TimetableGrid::clear(int batchIndex, int day, int slot) {
    if (!inBounds(batchIndex, day, slot)) return std::nullopt;
    auto& cell = cells_[cellIndex(batchIndex, day, slot)];
    std::optional<ClassAssignment> removed = std::move(cell);
    cell.reset();
    return removed;
}

bool TimetableGrid::locate(int assignmentId, int& batchIndex, int& day, int& slot) const {
    for (int b = 0; b < numBatches_; ++b) {
        for (int d = 0; d < numDays_; ++d) {
            for (int s = 0; s < slotsPerDay_; ++s) {
                const auto& cell = cells_[cellIndex(b, d, s)];
                if (cell && cell->id == assignmentId) {
                    batchIndex = b;
                    day = d;
                    slot = s;
                    return true;
                }
            }
        }
    }
    return false;
}

int TimetableGrid::size() const {
    return (int)std::count_if(cells_.begin(), cells_.end(),
                              [](const std::optional<ClassAssignment>& c) { return c.has_value(); });
}

std::vector<ClassAssignment> TimetableGrid::assignments() const {
    std::vector<ClassAssignment> out;
    for (const auto& cell : cells_) {
        if (cell) out.push_back(*cell);
    }
    return out;
}

std::vector<const ClassAssignment*> TimetableGrid::assignmentsAt(int day, int slot) const {
    std::vector<const ClassAssignment*> out;
    if (day < 0 || day >= numDays_ || slot < 0 || slot >= slotsPerDay_) return out;
    for (int b = 0; b < numBatches_; ++b) {
        const auto& cell = cells_[cellIndex(b, day, slot)];
        if (cell) out.push_back(&*cell);
    }
    return out;
}

bool TimetableGrid::sameContent(const TimetableGrid& other) const {
    if (numBatches_ != other.numBatches_ || numDays_ != other.numDays_ ||
        slotsPerDay_ != other.slotsPerDay_) {
        return false;
    }
    for (size_t i = 0; i < cells_.size(); ++i) {
        const auto& a = cells_[i];
        const auto& b = other.cells_[i];
        if (a.has_value() != b.has_value()) return false;
        if (a && !a->sameContent(*b)) return false;
    }
    return true;
}

void TimetableGrid::copyDays(const TimetableGrid& source, int batchIndex, int fromDay, int toDay) {
    if (source.numBatches_ != numBatches_ || source.numDays_ != numDays_ ||
        source.slotsPerDay_ != slotsPerDay_) {
        throw std::invalid_argument("copyDays: grids have different shapes");
    }
    fromDay = std::max(fromDay, 0);
    toDay = std::min(toDay, numDays_);
    for (int d = fromDay; d < toDay; ++d) {
        for (int s = 0; s < slotsPerDay_; ++s) {
            cells_[cellIndex(batchIndex, d, s)] = source.cells_[cellIndex(batchIndex, d, s)];
        }
    }
}

void TimetableGrid::renumber() {
    int id = 1;
    for (auto& cell : cells_) {
        if (cell) cell->id = id++;
    }
    nextId_ = id;
}


///////////////////////////
///    SERIALIZATION    ///
///////////////////////////
std::vector<int> TimetableGrid::encode() const {
    std::vector<int> buffer;
    buffer.push_back(numBatches_);
    buffer.push_back(numDays_);
    buffer.push_back(slotsPerDay_);
    buffer.push_back(nextId_);
    buffer.push_back(size());
    for (int b = 0; b < numBatches_; ++b) {
        for (int d = 0; d < numDays_; ++d) {
            for (int s = 0; s < slotsPerDay_; ++s) {
                const auto& cell = cells_[cellIndex(b, d, s)];
                if (!cell) continue;
                buffer.push_back(b);
                buffer.push_back(cell->id);
                buffer.push_back(cell->subjectId);
                buffer.push_back(cell->roomId);
                buffer.push_back(cell->batchId);
                buffer.push_back(cell->day);
                buffer.push_back(cell->slot);
                buffer.push_back(cell->pinned ? 1 : 0);
                buffer.push_back((int)cell->facultyIds.size());
                for (int fid : cell->facultyIds) buffer.push_back(fid);
            }
        }
    }
    return buffer;
}

TimetableGrid TimetableGrid::decode(const std::vector<int>& buffer) {
    size_t pos = 0;
    auto next = [&]() -> int {
        if (pos >= buffer.size()) {
            throw std::invalid_argument("TimetableGrid::decode: truncated buffer");
        }
        return buffer[pos++];
    };

    int numBatches = next();
    int numDays = next();
    int slotsPerDay = next();
    int nextId = next();
    int count = next();

    TimetableGrid grid(numBatches, numDays, slotsPerDay);
    for (int i = 0; i < count; ++i) {
        int batchIndex = next();
        ClassAssignment a;
        a.id = next();
        a.subjectId = next();
        a.roomId = next();
        a.batchId = next();
        a.day = next();
        a.slot = next();
        a.pinned = next() != 0;
        int numFaculty = next();
        if (numFaculty < 0) {
            throw std::invalid_argument("TimetableGrid::decode: negative faculty count");
        }
        for (int f = 0; f < numFaculty; ++f) a.facultyIds.push_back(next());
        if (!grid.put(batchIndex, a)) {
            throw std::invalid_argument("TimetableGrid::decode: assignment outside grid bounds");
        }
    }
    grid.nextId_ = std::max(grid.nextId_, nextId);
    return grid;
}
