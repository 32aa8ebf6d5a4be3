#pragma once

#include <eqnet/models/izhikevich.h>
#include <eqnet/models/lif.h>


using Models = ::testing::Types<eqnet::models::izhikevich, eqnet::models::lif>;

#define TEST_ALL_MODELS( X )   \
	template <typename T>      \
	struct X : ::testing::Test \
	{                          \
	};                         \
	TYPED_TEST_SUITE( X, Models );
