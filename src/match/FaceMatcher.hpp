#pragma once
#include <map>
#include <vector>
#include <QString>
#include "include/types.hpp"

// identity 별 저장 임베딩 중 가장 가까운 것과의 Euclidean 거리로 판정하는 최근접 분류기.
// 인덱스는 생성 후 읽기 전용이라 여러 스레드에서 classify 해도 된다
class FaceMatcher {
	public:
		struct Entry {
			QString identityKey;
			std::vector<FaceEmbedding> embeddings;
		};

		FaceMatcher() = default;

		// 빈/차원 불일치/유한하지 않은 임베딩은 경고 후 제외. 남은 게 없으면 identity도 제외.
		// 기준 차원은 expectedDim (보통 모델 출력 차원), 0이면 유효 임베딩의 다수 차원
		static FaceMatcher buildIndex(const std::map<QString, std::vector<FaceEmbedding>>& identityEmbeddings,
									  float threshold, size_t expectedDim = 0);

		// 최소 거리 <= threshold 면 해당 identity, 아니면 unknown.
		// 같은 거리면 identity_key 사전순으로 앞선 쪽
		MatchResult classify(const FaceEmbedding& probe) const;

		float threshold() const { return threshold_; }
		size_t dimension() const { return dim_; }
		size_t size() const { return entries_.size(); }
		bool empty() const { return entries_.empty(); }

		// 차원이 다르면 +inf
		static float euclidean(const FaceEmbedding& a, const FaceEmbedding& b);

	private:
		std::vector<Entry> entries_;		// identityKey 오름차순
		float threshold_ = 0.6f;
		size_t dim_ = 0;
};
