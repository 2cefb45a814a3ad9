#ifndef SEQLIST_SEQLIST_HPP
#define SEQLIST_SEQLIST_HPP

#include "common.hpp"
#include "list.hpp"
#include "singly_linked_list.hpp"
#include "doubly_linked_list.hpp"

#endif // SEQLIST_SEQLIST_HPP
