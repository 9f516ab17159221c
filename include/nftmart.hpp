#pragma once

#include "nftmart/nftmart.hpp"
