//
//  staging.hpp
//
//  Copyright (c) 2019 2025 Andrea Bondavalli. All rights reserved.
//
//  This program is free software: you can redistribute it and/or modify
//  it under the terms of the MIT license
//
//  This program is distributed in the hope that it will be useful,
//  but WITHOUT ANY WARRANTY; without even the implied warranty of
//  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
//

#ifndef _STAGING_HPP_
#define _STAGING_HPP_

#include <cstdint>
#include <filesystem>
#include <system_error>

/* Moves a finished staging recording to its canonical path.
   The staging file must be larger than min_bytes, otherwise the result is
   empty_recording and no canonical file is created. The copy goes through
   <canonical>.part and a rename, so readers never see a partial file.
   The staging file is removed in every case. */
std::error_code promote_staging(const std::filesystem::path &staging,
                                const std::filesystem::path &canonical,
                                uint64_t min_bytes, uint64_t &bytes);

/* removes a staging file, logging instead of failing */
void discard_staging(const std::filesystem::path &staging);

#endif
