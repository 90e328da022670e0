#include "match/FaceMatcher.hpp"
#include "match/DescriptorCodec.hpp"
#include "log/LogCategories.hpp"

#include <QDebug>
#include <algorithm>
#include <cmath>
#include <limits>

namespace {
inline bool allFinite(const FaceEmbedding& v) {
	return std::all_of(v.begin(), v.end(), [](float x) { return std::isfinite(x); });
}
} // namespace

float FaceMatcher::euclidean(const FaceEmbedding& a, const FaceEmbedding& b)
{
	if (a.size() != b.size() || a.empty())
		return std::numeric_limits<float>::infinity();

	double s = 0.0;
	for (size_t i = 0; i < a.size(); i++) {
		const double d = double(a[i]) - double(b[i]);
		s += d * d;
	}
	return static_cast<float>(std::sqrt(s));
}

FaceMatcher FaceMatcher::buildIndex(const std::map<QString, std::vector<FaceEmbedding>>& identityEmbeddings,
									float threshold, size_t expectedDim)
{
	FaceMatcher m;
	m.threshold_ = threshold;

	if (expectedDim) {
		m.dim_ = expectedDim;
	}
	else {
		// 첫 항목이 아니라 다수 차원 기준 (이상한 행 하나가 전체를 버리지 않게)
		std::map<size_t, int> dims;
		for (const auto& [key, embs] : identityEmbeddings)
			for (const auto& v : embs)
				if (!v.empty() && allFinite(v)) ++dims[v.size()];
		m.dim_ = DescriptorCodec::dominantDimension(dims);
	}

	// std::map 순회 = identityKey 오름차순
	for (const auto& [key, embs] : identityEmbeddings) {
		Entry e;
		e.identityKey = key;
		for (size_t i = 0; i < embs.size(); ++i) {
			const auto& v = embs[i];
			if (v.empty() || !allFinite(v)) {
				qCWarning(lcMatch) << "[FaceMatcher] invalid embedding" << key << "#" << i << "(skipped)";
				continue;
			}
			if (v.size() != m.dim_) {
				qCWarning(lcMatch) << "[FaceMatcher] dim mismatch" << key << "#" << i
								   << v.size() << "vs" << m.dim_ << "(skipped)";
				continue;
			}
			e.embeddings.push_back(v);
		}
		if (e.embeddings.empty()) {
			qCWarning(lcMatch) << "[FaceMatcher] no usable embeddings for" << key;
			continue;
		}
		m.entries_.push_back(std::move(e));
	}

	qCDebug(lcMatch) << "[FaceMatcher] index built identities=" << m.entries_.size()
					 << "dim=" << m.dim_ << "thr=" << threshold;
	return m;
}

MatchResult FaceMatcher::classify(const FaceEmbedding& probe) const
{
	MatchResult r;
	if (entries_.empty()) return r;
	if (probe.size() != dim_ || !allFinite(probe)) {
		qCWarning(lcMatch) << "[FaceMatcher] probe rejected dim=" << probe.size() << "expected=" << dim_;
		return r;
	}

	float best = std::numeric_limits<float>::infinity();
	float second = std::numeric_limits<float>::infinity();
	const Entry* bestEntry = nullptr;
	const Entry* secondEntry = nullptr;

	for (const auto& e : entries_) {
		float nearest = std::numeric_limits<float>::infinity();
		for (const auto& v : e.embeddings)
			nearest = std::min(nearest, euclidean(probe, v));

		// strict '<' : 동점이면 먼저 나온(사전순 앞) identity 유지
		if (nearest < best) {
			second = best;
			secondEntry = bestEntry;
			best = nearest;
			bestEntry = &e;
		}
		else if (nearest < second) {
			second = nearest;
			secondEntry = &e;
		}
	}

	if (secondEntry) {
		r.runnerUpKey = secondEntry->identityKey;
		r.runnerUpDistance = second;
	}
	if (!bestEntry) return r;

	r.distance = best;
	if (best <= threshold_) {
		r.identityKey = bestEntry->identityKey;
	}

	qCDebug(lcMatch) << "[FaceMatcher] best=" << bestEntry->identityKey << "d=" << best
					 << "second=" << r.runnerUpKey << "d=" << r.runnerUpDistance
					 << (r.known() ? "match" : "unknown");
	return r;
}
