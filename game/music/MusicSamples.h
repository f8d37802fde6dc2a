// Names and procedural tone recipes for every sample the music can trigger.
#pragma once

#include <string>
#include <utility>
#include <vector>

#include "../../engine/audio/Tone.h"

namespace Game {

std::string melodySampleName(int semitone);
// Instruments 0..3 map to bass, lead, pad and drum voices.
std::string rhythmSampleName(int instrument, int value);
std::string ambientSampleName(int variant);

// Every name the music can emit, paired with how to synthesize it.
std::vector<std::pair<std::string, Engine::Audio::ToneSpec>> musicSampleBank(float volume01);

}  // namespace Game
