#ifndef LUMI_UNIT_H
#define LUMI_UNIT_H

// Every test source defines BOOST_TEST_MODULE before including this file

#define BOOST_TEST_DYN_LINK

#include <boost/test/unit_test.hpp>

#endif /* LUMI_UNIT_H */
