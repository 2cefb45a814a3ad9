#include <gtest/gtest.h>
#include <seqlist/seqlist.hpp>

#include <cstddef>
#include <random>
#include <vector>

using seqlist::DoublyLinkedList;
using seqlist::Handle;
using seqlist::ListError;
using seqlist::SinglyLinkedList;
using seqlist::index_type;

/*

RANDOMISED OPERATION SEQUENCES, CHECKED AGAINST A std::vector MODEL.
After every step: validate() (for the doubly linked list this includes
link symmetry), size == number of iterated elements, and iteration order
matches the model handle for handle.
*/

template<typename L>
class ListPropertyTest : public ::testing::Test {
protected:
    void check_against_model(std::size_t step) {
        auto ok = list_.validate();
        ASSERT_TRUE(ok.has_value()) << "step " << step << ": " << ok.error().message();
        ASSERT_EQ(list_.size(), static_cast<index_type>(model_.size())) << "step " << step;
        ASSERT_EQ(list_.is_empty(), model_.empty()) << "step " << step;

        std::size_t i = 0;
        for (const auto& item : list_) {
            ASSERT_LT(i, model_.size()) << "step " << step;
            ASSERT_EQ(item.get(), model_[i].get()) << "step " << step << " index " << i;
            ++i;
        }
        ASSERT_EQ(i, model_.size()) << "step " << step;
    }

    L list_;
    std::vector<Handle<int>> model_;
};

using Implementations = ::testing::Types<SinglyLinkedList<int>, DoublyLinkedList<int>>;
TYPED_TEST_SUITE(ListPropertyTest, Implementations);

TYPED_TEST(ListPropertyTest, RandomOperationsMatchModel) {
    auto& list = this->list_;
    auto& model = this->model_;

    std::mt19937 rng(42);
    int next_value = 0;

    constexpr std::size_t STEPS = 4000;
    for (std::size_t step = 0; step < STEPS; ++step) {
        const auto size = static_cast<index_type>(model.size());
        // mostly in range, sometimes one past either end
        std::uniform_int_distribution<index_type> index_dist(-1, size);
        const index_type index = index_dist(rng);
        const bool in_range = index >= 0 && index < size;

        switch (rng() % 9) {
            case 0:
            case 1: { // add
                auto h = std::make_shared<int>(next_value++);
                list.add(h);
                model.push_back(h);
                break;
            }
            case 2: { // insert_at
                auto h = std::make_shared<int>(next_value++);
                auto r = list.insert_at(h, index);
                if (in_range) {
                    ASSERT_TRUE(r.has_value()) << "step " << step;
                    model.insert(model.begin() + index, h);
                } else {
                    ASSERT_FALSE(r.has_value());
                    EXPECT_EQ(r.error(), ListError::IndexOutOfBounds);
                }
                break;
            }
            case 3: { // get
                auto r = list.get(index);
                if (in_range) {
                    ASSERT_TRUE(r.has_value()) << "step " << step;
                    EXPECT_EQ(r->get(), model[index].get());
                } else {
                    EXPECT_EQ(r.error(), ListError::IndexOutOfBounds);
                }
                break;
            }
            case 4: { // remove_at
                auto r = list.remove_at(index);
                if (in_range) {
                    ASSERT_TRUE(r.has_value()) << "step " << step;
                    EXPECT_EQ(r->get(), model[index].get());
                    model.erase(model.begin() + index);
                } else {
                    EXPECT_EQ(r.error(), ListError::IndexOutOfBounds);
                }
                break;
            }
            case 5: { // remove by identity, stored or fresh
                if (in_range && rng() % 4 != 0) {
                    auto h = model[index];
                    ASSERT_TRUE(list.remove(h).has_value()) << "step " << step;
                    model.erase(model.begin() + index);
                    EXPECT_FALSE(list.contains(h));
                } else {
                    auto r = list.remove(std::make_shared<int>(0));
                    ASSERT_FALSE(r.has_value());
                    EXPECT_EQ(r.error(), model.empty() ? ListError::OperationOnEmptyList
                                                       : ListError::ElementNotFound);
                }
                break;
            }
            case 6: { // shift
                auto r = list.shift();
                if (model.empty()) {
                    EXPECT_EQ(r.error(), ListError::OperationOnEmptyList);
                } else {
                    ASSERT_TRUE(r.has_value()) << "step " << step;
                    EXPECT_EQ(r->get(), model.front().get());
                    model.erase(model.begin());
                }
                break;
            }
            case 7: { // pop
                auto r = list.pop();
                if (model.empty()) {
                    EXPECT_EQ(r.error(), ListError::OperationOnEmptyList);
                } else {
                    ASSERT_TRUE(r.has_value()) << "step " << step;
                    EXPECT_EQ(r->get(), model.back().get());
                    model.pop_back();
                }
                break;
            }
            case 8: { // contains
                if (in_range) {
                    EXPECT_TRUE(list.contains(model[index]));
                }
                EXPECT_FALSE(list.contains(std::make_shared<int>(next_value)));
                break;
            }
        }

        this->check_against_model(step);
        if (::testing::Test::HasFatalFailure()) {
            return;
        }
    }
}

TYPED_TEST(ListPropertyTest, BuildUpThenDrainFromBothEnds) {
    auto& list = this->list_;
    auto& model = this->model_;

    for (int i = 0; i < 64; ++i) {
        auto h = std::make_shared<int>(i);
        if (i % 3 == 0 || model.empty()) {
            list.add(h);
            model.push_back(h);
        } else {
            const auto index = static_cast<index_type>(model.size() / 2);
            ASSERT_TRUE(list.insert_at(h, index).has_value());
            model.insert(model.begin() + index, h);
        }
        this->check_against_model(i);
    }

    bool front = true;
    while (!model.empty()) {
        auto r = front ? list.shift() : list.pop();
        ASSERT_TRUE(r.has_value());
        EXPECT_EQ(r->get(), (front ? model.front() : model.back()).get());
        if (front) {
            model.erase(model.begin());
        } else {
            model.pop_back();
        }
        front = !front;
        this->check_against_model(model.size());
    }
}

TYPED_TEST(ListPropertyTest, CloneAfterMutationsIsIndependent) {
    auto& list = this->list_;
    std::mt19937 rng(7);

    for (int i = 0; i < 50; ++i) {
        list.add_raw(i);
    }
    for (int i = 0; i < 20; ++i) {
        std::uniform_int_distribution<index_type> dist(0, list.size() - 1);
        ASSERT_TRUE(list.remove_at(dist(rng)).has_value());
    }

    auto copy = list.clone();
    ASSERT_TRUE(copy->validate().has_value());
    ASSERT_EQ(copy->size(), list.size());
    for (index_type i = 0; i < list.size(); ++i) {
        EXPECT_EQ(copy->get(i).value().get(), list.get(i).value().get());
    }

    while (!copy->is_empty()) {
        ASSERT_TRUE(copy->pop().has_value());
    }
    EXPECT_EQ(list.size(), 30);
    EXPECT_TRUE(list.validate().has_value());
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
