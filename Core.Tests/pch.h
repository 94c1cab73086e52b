#pragma once
#include "Core/pch.h"
#include <gtest/gtest.h>
