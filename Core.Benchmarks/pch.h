#pragma once
#include "Core/pch.h"
#include <benchmark/benchmark.h>
