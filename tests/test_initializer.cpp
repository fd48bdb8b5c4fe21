#include <cassert>
#include <cmath>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <random>
#include <stdexcept>
#include "Initializer.hpp"

void test_random_cells_respect_min_distance()
{
    std::mt19937 gen(17);
    InitResult r = Initializer::initRandomCells(50, 20.0, 1.0, {0.5, 0.5}, gen);

    assert(r.positions.sameShape(50, 2));
    assert(r.cellTypes.size() == 50);
    for (size_t i = 0; i < 50; ++i) {
        assert(r.positions(i, COL_Y) >= 0.0 && r.positions(i, COL_Y) < 20.0);
        assert(r.positions(i, COL_X) >= 0.0 && r.positions(i, COL_X) < 20.0);
        assert(r.cellTypes[i] == 0 || r.cellTypes[i] == 1);
        for (size_t j = 0; j < i; ++j) {
            double dy = r.positions(i, COL_Y) - r.positions(j, COL_Y);
            double dx = r.positions(i, COL_X) - r.positions(j, COL_X);
            assert(std::sqrt(dx*dx + dy*dy) >= 1.0);
        }
    }
    assert(!r.metadata.empty());
}

void test_random_cells_impossible_packing()
{
    std::mt19937 gen(17);
    bool thrown = false;
    try {
        Initializer::initRandomCells(10, 1.0, 5.0, {}, gen);
    } catch (const std::runtime_error&) {
        thrown = true;
    }
    assert(thrown);
}

void test_grid_layout()
{
    std::mt19937 gen(4);
    InitResult r = Initializer::initGrid(3, 4, 2.0, 0.0, {}, gen);

    assert(r.positions.sameShape(12, 2));
    // Row-major lattice: cell 5 is row 1, column 1
    assert(r.positions(5, COL_Y) == 2.0);
    assert(r.positions(5, COL_X) == 2.0);
    assert(r.positions(11, COL_Y) == 4.0);
    assert(r.positions(11, COL_X) == 6.0);
    for (int t : r.cellTypes) assert(t == 0);

    InitResult jittered = Initializer::initGrid(3, 4, 2.0, 0.25, {1.0, 1.0, 1.0}, gen);
    for (size_t i = 0; i < 12; ++i) {
        assert(std::abs(jittered.positions(i, COL_Y) - r.positions(i, COL_Y)) <= 0.25);
        assert(std::abs(jittered.positions(i, COL_X) - r.positions(i, COL_X)) <= 0.25);
        assert(jittered.cellTypes[i] >= 0 && jittered.cellTypes[i] <= 2);
    }
}

void test_from_file()
{
    auto path = std::filesystem::temp_directory_path() / "cellsim_test_cells.csv";
    {
        std::ofstream out(path);
        out << "# two cells\n"
            << "y,x,type\n"
            << "1.5,2.5,1\n"
            << "-3,4e-1\n";
    }

    InitResult r = Initializer::initFromFile(path.string());
    assert(r.positions.sameShape(2, 2));
    assert(r.positions(0, COL_Y) == 1.5);
    assert(r.positions(0, COL_X) == 2.5);
    assert(r.positions(1, COL_Y) == -3.0);
    assert(r.positions(1, COL_X) == 0.4);
    assert(r.cellTypes[0] == 1);
    assert(r.cellTypes[1] == 0);

    std::filesystem::remove(path);

    bool thrown = false;
    try {
        Initializer::initFromFile(path.string());
    } catch (const std::runtime_error&) {
        thrown = true;
    }
    assert(thrown);
}

void test_from_file_crlf()
{
    auto path = std::filesystem::temp_directory_path() / "cellsim_test_cells_crlf.csv";
    {
        std::ofstream out(path, std::ios::binary);
        out << "y,x,type\r\n0,0,0\r\n0,3,1\r\n\r\n";
    }

    InitResult r = Initializer::initFromFile(path.string());
    assert(r.positions.sameShape(2, 2));
    assert(r.positions(1, COL_X) == 3.0);
    assert(r.cellTypes.size() == 2);
    assert(r.cellTypes[0] == 0 && r.cellTypes[1] == 1);

    std::filesystem::remove(path);
}

void test_type_pair_mask()
{
    std::vector<int> types = {0, 1, 1, 0, 2};
    InteractionMask cross = buildTypePairMask(types, 1, 0);
    InteractionMask same = buildTypePairMask(types, 1, 1);

    for (size_t i = 0; i < types.size(); ++i) {
        assert(cross(i, i) == 0);
        assert(same(i, i) == 0);
        for (size_t j = 0; j < types.size(); ++j) {
            assert(cross(i, j) == cross(j, i));
            assert(same(i, j) == same(j, i));
        }
    }
    assert(cross(0, 1) == 1 && cross(3, 2) == 1);
    assert(cross(0, 3) == 0 && cross(1, 2) == 0 && cross(4, 0) == 0);
    assert(same(1, 2) == 1 && same(0, 1) == 0);
}

int main()
{
    test_random_cells_respect_min_distance();
    test_random_cells_impossible_packing();
    test_grid_layout();
    test_from_file();
    test_from_file_crlf();
    test_type_pair_mask();
    return 0;
}
