#include "PCB.hpp"

PCB::PCB(const ProcessDescriptor &descriptor)
    : descriptor(descriptor),
      remainingTime(descriptor.burstTime) {}

std::string stateName(State state) {
    switch (state) {
    case State::New:
        return "New";
    case State::Ready:
        return "Ready";
    case State::Running:
        return "Running";
    case State::Terminated:
        return "Terminated";
    }
    return "Unknown";
}
