/**
 * @file interfaces.h
 * @brief Master include for all voxserve interfaces
 */

#pragma once

#include "i_transcription_provider.h"
#include "i_text_processor.h"
