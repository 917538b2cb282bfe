#pragma once

#include "scribe/ledger/v1/ledger.pb.h"
#include "scribe/transcript/v1/transcript.pb.h"

namespace scribe::v1 {
using namespace ::scribe::ledger::v1;
using namespace ::scribe::transcript::v1;
}
