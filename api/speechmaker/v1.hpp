#pragma once

#include "speechmaker/v1/speech_service.pb.h"
#include "speechmaker/v1/types.pb.h"
