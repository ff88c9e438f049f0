#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include "sgylib/SegyUtil.hpp"

// SEG-Y rev 1 binary file header, offsets relative to byte 3201
inline const std::unordered_map<std::string, FieldInfo> BinFieldOffsets = {
    {"JobID",                   {0, 4}},
    {"LineNumber",              {4, 4}},
    {"ReelNumber",              {8, 4}},
    {"DataTracesPerEnsemble",   {12, 2}},
    {"AuxTracesPerEnsemble",    {14, 2}},
    {"SampleInterval",          {16, 2}},
    {"SampleIntervalOriginal",  {18, 2}},
    {"SamplesPerTrace",         {20, 2}},
    {"SamplesPerTraceOriginal", {22, 2}},
    {"DataSampleFormat",        {24, 2}},
    {"EnsembleFold",            {26, 2}},
    {"TraceSorting",            {28, 2}},
    {"MeasurementSystem",       {54, 2}},
    {"SEGYRevision",            {300, 2}},
    {"FixedLengthTraceFlag",    {302, 2}},
    {"ExtendedTextHeaders",     {304, 2}},
};

inline const FieldInfo& bin_field(const std::string& key) {
    auto it = BinFieldOffsets.find(key);
    if (it == BinFieldOffsets.end()) throw std::invalid_argument("Unknown binary header field: " + key);
    return it->second;
}

inline int32_t get_bin_field_value(const uint8_t* bin_header, const std::string& key) {
    return get_field_value(bin_header, bin_field(key));
}

inline void set_bin_field_value(uint8_t* bin_header, const std::string& key, int32_t value) {
    set_field_value(bin_header, bin_field(key), value);
}
