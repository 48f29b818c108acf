///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"


///////////////////////////
///       MODELS        ///
///////////////////////////
std::string toString(RoomType type) {
    switch (type) {
        case RoomType::LECTURE_HALL: return "Lecture Hall";
        case RoomType::LAB:          return "Lab";
        case RoomType::WORKSHOP:     return "Workshop";
    }
    return "Unknown";
}

std::string toString(SubjectType type) {
    switch (type) {
        case SubjectType::THEORY:    return "Theory";
        case SubjectType::PRACTICAL: return "Practical";
        case SubjectType::WORKSHOP:  return "Workshop";
    }
    return "Unknown";
}
