#include "Initializer.hpp"
#include <sstream>
#include <cmath>
#include <stdexcept>
#include <fstream>
#include <numeric>

using namespace std;

namespace {
    // Attempts per cell before random placement gives up
    const int MAX_PLACEMENT_ATTEMPTS = 10000;

    vector<int> assignTypes(size_t n, const vector<double>& typeFractions, mt19937& gen)
    {
        vector<int> types(n, 0);
        if (typeFractions.empty()) return types;

        for (double f : typeFractions) {
            if (f < 0.0) throw runtime_error("Cell type fractions must be non-negative");
        }
        if (accumulate(typeFractions.begin(), typeFractions.end(), 0.0) <= 0.0) {
            throw runtime_error("Cell type fractions must not all be zero");
        }

        discrete_distribution<int> typeDist(typeFractions.begin(), typeFractions.end());
        for (auto& t : types) t = typeDist(gen);
        return types;
    }

    string fractionsString(const vector<double>& typeFractions)
    {
        if (typeFractions.empty()) return "[1]";
        ostringstream s;
        s << "[";
        for (size_t i = 0; i < typeFractions.size(); ++i) {
            if (i) s << ",";
            s << typeFractions[i];
        }
        s << "]";
        return s.str();
    }
}

InitResult Initializer::initRandomCells(int n,
                                        double boxSize,
                                        double minDistance,
                                        const vector<double>& typeFractions,
                                        mt19937& gen)
{
    if (n < 0) throw runtime_error("Number of cells must be non-negative");
    if (boxSize <= 0.0) throw runtime_error("boxSize must be positive");

    Matrix pos(n, 2);
    uniform_real_distribution<double> posDist(0.0, boxSize);
    const double minDist2 = minDistance * minDistance;

    for (int i = 0; i < n; ++i) {
        bool placed = false;
        for (int attempt = 0; attempt < MAX_PLACEMENT_ATTEMPTS && !placed; ++attempt) {
            double y = posDist(gen);
            double x = posDist(gen);

            placed = true;
            for (int j = 0; j < i; ++j) {
                double dy = pos(j, COL_Y) - y;
                double dx = pos(j, COL_X) - x;
                if (dx*dx + dy*dy < minDist2) {
                    placed = false;
                    break;
                }
            }

            if (placed) {
                pos(i, COL_Y) = y;
                pos(i, COL_X) = x;
            }
        }
        if (!placed) {
            throw runtime_error("Could not place cell " + to_string(i) + " with minDistance "
                                + to_string(minDistance) + " in a box of size " + to_string(boxSize));
        }
    }

    ostringstream metaStream;
    metaStream << "# Initializer: Random cells\n"
               << "# Total cell count: " << n << "\n"
               << "# boxSize: " << boxSize << "\n"
               << "# minDistance: " << minDistance << "\n"
               << "# typeFractions: " << fractionsString(typeFractions) << "\n";

    return { pos, assignTypes(n, typeFractions, gen), metaStream.str() };
}

InitResult Initializer::initGrid(int rows,
                                 int cols,
                                 double spacing,
                                 double jitter,
                                 const vector<double>& typeFractions,
                                 mt19937& gen)
{
    if (rows < 0 || cols < 0) throw runtime_error("Grid dimensions must be non-negative");

    const size_t n = static_cast<size_t>(rows) * static_cast<size_t>(cols);
    Matrix pos(n, 2);
    uniform_real_distribution<double> jitterDist(-jitter, jitter);

    size_t idx = 0;
    for (int r = 0; r < rows; ++r) {
        for (int c = 0; c < cols; ++c, ++idx) {
            double dy = jitter > 0.0 ? jitterDist(gen) : 0.0;
            double dx = jitter > 0.0 ? jitterDist(gen) : 0.0;
            pos(idx, COL_Y) = r * spacing + dy;
            pos(idx, COL_X) = c * spacing + dx;
        }
    }

    ostringstream metaStream;
    metaStream << "# Initializer: Grid\n"
               << "# Total cell count: " << n << "\n"
               << "# rows: " << rows << "\n"
               << "# cols: " << cols << "\n"
               << "# spacing: " << spacing << "\n"
               << "# jitter: " << jitter << "\n"
               << "# typeFractions: " << fractionsString(typeFractions) << "\n";

    return { pos, assignTypes(n, typeFractions, gen), metaStream.str() };
}

InitResult Initializer::initFromFile(const string& filePath)
{
    ifstream file(filePath);
    if (!file)
        throw runtime_error("Cannot open file: " + filePath);

    vector<double> ys, xs;
    vector<int> types;
    string line;
    bool headerSkipped = false;
    int lineNo = 0;

    while (getline(file, line)) {
        ++lineNo;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty() || line[0] == '#') continue;

        // First non-comment line may be a column header
        if (!headerSkipped) {
            headerSkipped = true;
            if (line.find_first_not_of("0123456789+-.eE, \t\r") != string::npos) continue;
        }

        for (auto& ch : line) {
            if (ch == ',') ch = ' ';
        }
        istringstream row(line);
        double y, x;
        if (!(row >> y >> x)) {
            throw runtime_error("Malformed cell row at " + filePath + ":" + to_string(lineNo));
        }
        int type = 0;
        if (!(row >> type)) type = 0;

        ys.push_back(y);
        xs.push_back(x);
        types.push_back(type);
    }

    Matrix pos(ys.size(), 2);
    for (size_t i = 0; i < ys.size(); ++i) {
        pos(i, COL_Y) = ys[i];
        pos(i, COL_X) = xs[i];
    }

    ostringstream metaStream;
    metaStream << "# Initializer: From file\n"
               << "# Total cell count: " << ys.size() << "\n"
               << "# filePath: " << filePath << "\n";

    return { pos, types, metaStream.str() };
}

InteractionMask buildTypePairMask(const vector<int>& cellTypes, int typeA, int typeB)
{
    const size_t n = cellTypes.size();
    InteractionMask mask(n, n, 0);

    for (size_t i = 0; i < n; ++i) {
        for (size_t j = 0; j < n; ++j) {
            if (i == j) continue;
            int ti = cellTypes[i];
            int tj = cellTypes[j];
            if ((ti == typeA && tj == typeB) || (ti == typeB && tj == typeA)) {
                mask(i, j) = 1;
            }
        }
    }

    return mask;
}
