#pragma once

#include "docsync/v1/document.pb.h"
#include "docsync/v1/stats.pb.h"
