#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include "sgylib/SegyUtil.hpp"

// SEG-Y rev 1 trace header, offsets relative to the start of the 240-byte header
inline const std::unordered_map<std::string, FieldInfo> TraceFieldOffsets = {
    {"TraceSequenceLine",       {0, 4}},
    {"TraceSequenceFile",       {4, 4}},
    {"FieldRecord",             {8, 4}},
    {"TraceNumber",             {12, 4}},
    {"EnergySourcePoint",       {16, 4}},
    {"CDP",                     {20, 4}},
    {"CDPTrace",                {24, 4}},
    {"TraceIdentificationCode", {28, 2}},
    {"offset",                  {36, 4}},
    {"SourceGroupScalar",       {70, 2}},
    {"SourceX",                 {72, 4}},
    {"SourceY",                 {76, 4}},
    {"GroupX",                  {80, 4}},
    {"GroupY",                  {84, 4}},
    {"CoordinateUnits",         {88, 2}},
    {"TraceSamples",            {114, 2}},
    {"TraceSampleInterval",     {116, 2}},
    {"CDP_X",                   {180, 4}},
    {"CDP_Y",                   {184, 4}},
    {"Inline",                  {188, 4}},
    {"Crossline",               {192, 4}},
};

inline const FieldInfo& trace_field(const std::string& key) {
    auto it = TraceFieldOffsets.find(key);
    if (it == TraceFieldOffsets.end()) throw std::invalid_argument("Unknown trace header field: " + key);
    return it->second;
}

inline int32_t get_trace_field_value(const uint8_t* trace_header, const std::string& key) {
    return get_field_value(trace_header, trace_field(key));
}

inline void set_trace_field_value(uint8_t* trace_header, const std::string& key, int32_t value) {
    set_field_value(trace_header, trace_field(key), value);
}
